#pragma once

#include <cstdint>
#include <string>

namespace pixserv {

/**
 * @class FilenameGenerator
 * @brief Produces "<base>-<millis>-<random><ext>" names for uploads
 *
 * Uniqueness is probabilistic: the generated name is never checked against
 * the storage directory.
 */
class FilenameGenerator {
public:
    static std::string generate(const std::string& originalName);

    // Same as generate() with the time and random parts supplied.
    static std::string compose(const std::string& originalName, int64_t epochMillis, uint32_t random);

    // Extension including the dot, case preserved. Empty for "name" and
    // ".hidden"; "." for "name.".
    static std::string extension(const std::string& filename);

    static std::string stem(const std::string& filename);

private:
    static uint32_t randomComponent();
};

} // namespace pixserv
