/**
 * @file PatchStore.hpp
 * @brief Human-readable JSON patch persistence.
 */

#ifndef TENDER_PATCH_STORE_HPP
#define TENDER_PATCH_STORE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "SynthParams.hpp"

namespace tender {

using json = nlohmann::json;

/**
 * @brief A named, versioned parameter snapshot.
 */
struct PatchData {
    int version = 1;
    std::string name;
    SynthParams params;
};

// The waveform is written by name; an index is also accepted on load.
void to_json(json& j, const SynthParams& p);
void from_json(const json& j, SynthParams& p);
void to_json(json& j, const PatchData& patch);
void from_json(const json& j, PatchData& patch);

/**
 * @brief Manages saving and loading of PatchData.
 *
 * Every operation reports success as a bool; diagnostics go to stderr.
 */
class PatchStore {
public:
    static bool save_to_file(const PatchData& patch, const std::string& path);
    static bool load_from_file(PatchData& patch, const std::string& path);

    /**
     * @brief Convert PatchData to an indented JSON string.
     */
    static std::string serialize(const PatchData& patch);

    /**
     * @brief Load PatchData from a JSON string.
     *
     * Missing fields keep their defaults. On failure @p patch is untouched.
     */
    static bool deserialize(PatchData& patch, const std::string& data);
};

} // namespace tender

#endif // TENDER_PATCH_STORE_HPP
