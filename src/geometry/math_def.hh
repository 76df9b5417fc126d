#ifndef EUCLIDEAN_MATH_DEF_HH
#define EUCLIDEAN_MATH_DEF_HH

#include <cmath>

template <typename T> inline int sign(T val)
{
    return (T(0) < val) - (val < T(0)); // <0: -1, >0: +1, =0: 0
}

// Largest and smallest non-zero magnitudes the adaptive predicates accept
// without overflow or underflow in their expansions.
inline double max_coordinate() { return std::ldexp(1.0, 201); }
inline double min_coordinate() { return std::ldexp(1.0, -142); }

inline bool is_valid_coordinate(double val)
{
    if (!std::isfinite(val)) return false;
    const double a = std::fabs(val);
    return a == 0 || (a >= min_coordinate() && a <= max_coordinate());
}

#endif
