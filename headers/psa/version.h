#ifndef PSA_VERSION_H
#define PSA_VERSION_H

/**
 * @file version.h
 * @brief Python Static Analyzer version information.
 */

namespace psa {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Python Static Analyzer";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "psa";

}  // namespace psa

#endif //PSA_VERSION_H
