#ifndef TAYLIX_OPTIMIZATION_H
#define TAYLIX_OPTIMIZATION_H

#include <algorithm>

namespace taylix {
namespace optimization {

    /**
     * @brief Soft Thresholding Operator
     * S(z, gamma) = sign(z) * max(|z| - gamma, 0)
     *
     * Negative gamma is treated as 0.
     */
    inline double soft_threshold(double z, double gamma) {
        double g = std::max(0.0, gamma);
        if (g == 0.0) return z;

        if (z > g) return z - g;
        if (z < -g) return z + g;
        return 0.0;
    }

} // namespace optimization
} // namespace taylix

#endif // TAYLIX_OPTIMIZATION_H
