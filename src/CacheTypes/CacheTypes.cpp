// === src/CacheTypes/CacheTypes.cpp ===
#include "CacheTypes.hpp"

const char* to_string(CacheSource s) {
    switch (s) {
        case CacheSource::Volatile: return "volatile";
        case CacheSource::Durable:  return "durable";
        case CacheSource::Upstream: return "upstream";
        default:                    return "none";
    }
}

const char* to_string(Priority p) {
    switch (p) {
        case Priority::Low:  return "low";
        case Priority::High: return "high";
        default:             return "normal";
    }
}
