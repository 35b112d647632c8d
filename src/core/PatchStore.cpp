#include "PatchStore.hpp"
#include "oscillator/Oscillator.hpp"
#include <fstream>
#include <iostream>
#include <iterator>

namespace tender {

void to_json(json& j, const SynthParams& p) {
    j = json{
        {"waveform", waveform_name(waveform_from_index(p.waveform))},
        {"attack_ms", p.attack_ms},
        {"decay_ms", p.decay_ms},
        {"sustain", p.sustain_level},
        {"release_ms", p.release_ms},
        {"gain", p.gain}
    };
}

void from_json(const json& j, SynthParams& p) {
    const SynthParams defaults;

    if (j.contains("waveform")) {
        const auto& w = j.at("waveform");
        if (w.is_string()) {
            const auto waveform = waveform_from_name(w.get<std::string>());
            p.waveform = static_cast<int>(waveform.value_or(Waveform::Sine));
        } else {
            p.waveform = static_cast<int>(waveform_from_index(w.get<int>()));
        }
    } else {
        p.waveform = defaults.waveform;
    }

    p.attack_ms = j.value("attack_ms", defaults.attack_ms);
    p.decay_ms = j.value("decay_ms", defaults.decay_ms);
    p.sustain_level = j.value("sustain", defaults.sustain_level);
    p.release_ms = j.value("release_ms", defaults.release_ms);
    p.gain = j.value("gain", defaults.gain);
}

void to_json(json& j, const PatchData& patch) {
    j = json{
        {"version", patch.version},
        {"name", patch.name},
        {"params", patch.params}
    };
}

void from_json(const json& j, PatchData& patch) {
    patch.version = j.value("version", 1);
    patch.name = j.value("name", std::string{});
    patch.params = j.contains("params") ? j.at("params").get<SynthParams>() : SynthParams{};
}

std::string PatchStore::serialize(const PatchData& patch) {
    json j = patch;
    return j.dump(4);
}

bool PatchStore::deserialize(PatchData& patch, const std::string& data) {
    try {
        const json j = json::parse(data);
        if (!j.is_object()) {
            std::cerr << "[PatchStore] Patch root must be a JSON object" << std::endl;
            return false;
        }
        patch = j.get<PatchData>();
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[PatchStore] Invalid patch: " << e.what() << std::endl;
        return false;
    }
}

bool PatchStore::save_to_file(const PatchData& patch, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[PatchStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(patch) << '\n';
    if (!file) {
        std::cerr << "[PatchStore] Failed to write patch: " << path << std::endl;
        return false;
    }
    return true;
}

bool PatchStore::load_from_file(PatchData& patch, const std::string& path) {
    std::cout << "[PatchStore] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[PatchStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    bool success = deserialize(patch, content);
    if (success) {
        std::cout << "[PatchStore] Successfully loaded patch: " << patch.name << std::endl;
    } else {
        std::cerr << "[PatchStore] Failed to deserialize patch from: " << path << std::endl;
    }
    return success;
}

} // namespace tender
