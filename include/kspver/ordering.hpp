#pragma once

namespace kspver {

// Tri-state result of comparing two long versions
enum class Ordering { Less = -1, Equal = 0, Greater = 1 };

const char* ordering_name(Ordering o);

inline Ordering reverse(Ordering o) {
    return static_cast<Ordering>(-static_cast<int>(o));
}

} // namespace kspver
