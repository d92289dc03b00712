// random_source.cpp

#include "hexsettle/random_source.h"
#include <stdexcept>
#include <string>

namespace hexsettle {

int ScriptedSource::uniform_int(int lo, int hi) {
    if (next_ >= script_.size()) {
        return fallback_.uniform_int(lo, hi);
    }
    const int value = script_[next_++];
    if (value < lo || value > hi) {
        throw std::out_of_range("scripted value " + std::to_string(value) +
                                " outside [" + std::to_string(lo) + ", " +
                                std::to_string(hi) + "]");
    }
    return value;
}

} // namespace hexsettle
