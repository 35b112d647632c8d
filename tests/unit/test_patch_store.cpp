#include <gtest/gtest.h>
#include "PatchStore.hpp"
#include "oscillator/Oscillator.hpp"
#include <filesystem>
#include <string>

using namespace tender;

namespace {

PatchData make_patch() {
    PatchData patch;
    patch.name = "Glass Keys";
    patch.params.waveform = static_cast<int>(Waveform::Triangle);
    patch.params.attack_ms = 2.5f;
    patch.params.decay_ms = 250.0f;
    patch.params.sustain_level = 0.4f;
    patch.params.release_ms = 800.0f;
    patch.params.gain = 0.5f;
    return patch;
}

} // namespace

TEST(PatchStoreTest, SerializeWritesWaveformByName) {
    auto text = PatchStore::serialize(make_patch());
    auto j = json::parse(text);
    EXPECT_EQ(j["version"].get<int>(), 1);
    EXPECT_EQ(j["name"].get<std::string>(), "Glass Keys");
    EXPECT_EQ(j["params"]["waveform"].get<std::string>(), "Triangle");
    EXPECT_FLOAT_EQ(j["params"]["sustain"].get<float>(), 0.4f);
}

TEST(PatchStoreTest, SerializeThenDeserialize) {
    const PatchData saved = make_patch();
    PatchData loaded;
    ASSERT_TRUE(PatchStore::deserialize(loaded, PatchStore::serialize(saved)));

    EXPECT_EQ(loaded.name, saved.name);
    EXPECT_EQ(loaded.params.waveform, saved.params.waveform);
    EXPECT_FLOAT_EQ(loaded.params.attack_ms, saved.params.attack_ms);
    EXPECT_FLOAT_EQ(loaded.params.decay_ms, saved.params.decay_ms);
    EXPECT_FLOAT_EQ(loaded.params.sustain_level, saved.params.sustain_level);
    EXPECT_FLOAT_EQ(loaded.params.release_ms, saved.params.release_ms);
    EXPECT_FLOAT_EQ(loaded.params.gain, saved.params.gain);
}

TEST(PatchStoreTest, MissingFieldsUseDefaults) {
    PatchData patch;
    ASSERT_TRUE(PatchStore::deserialize(patch, R"({"name": "Bare", "params": {"attack_ms": 50}})"));

    const SynthParams defaults;
    EXPECT_EQ(patch.name, "Bare");
    EXPECT_EQ(patch.version, 1);
    EXPECT_FLOAT_EQ(patch.params.attack_ms, 50.0f);
    EXPECT_EQ(patch.params.waveform, defaults.waveform);
    EXPECT_FLOAT_EQ(patch.params.release_ms, defaults.release_ms);
    EXPECT_FLOAT_EQ(patch.params.gain, defaults.gain);

    PatchData empty;
    ASSERT_TRUE(PatchStore::deserialize(empty, "{}"));
    EXPECT_FLOAT_EQ(empty.params.sustain_level, defaults.sustain_level);
}

TEST(PatchStoreTest, WaveformAcceptsNameOrIndex) {
    PatchData patch;
    ASSERT_TRUE(PatchStore::deserialize(patch, R"({"params": {"waveform": 2}})"));
    EXPECT_EQ(patch.params.waveform, static_cast<int>(Waveform::Square));

    ASSERT_TRUE(PatchStore::deserialize(patch, R"({"params": {"waveform": "Sawtooth"}})"));
    EXPECT_EQ(patch.params.waveform, static_cast<int>(Waveform::Sawtooth));

    // Unknown values fall back to sine
    ASSERT_TRUE(PatchStore::deserialize(patch, R"({"params": {"waveform": "Noise"}})"));
    EXPECT_EQ(patch.params.waveform, static_cast<int>(Waveform::Sine));
    ASSERT_TRUE(PatchStore::deserialize(patch, R"({"params": {"waveform": 9}})"));
    EXPECT_EQ(patch.params.waveform, static_cast<int>(Waveform::Sine));
}

TEST(PatchStoreTest, RejectsMalformedInput) {
    PatchData patch = make_patch();
    EXPECT_FALSE(PatchStore::deserialize(patch, "{ not json"));
    EXPECT_FALSE(PatchStore::deserialize(patch, "[1, 2, 3]"));
    EXPECT_FALSE(PatchStore::deserialize(patch, R"({"params": {"attack_ms": "fast"}})"));

    // A failed load leaves the patch untouched
    EXPECT_EQ(patch.name, "Glass Keys");
    EXPECT_FLOAT_EQ(patch.params.attack_ms, 2.5f);
}

TEST(PatchStoreTest, FileRoundTrip) {
    const auto path = std::filesystem::temp_directory_path() / "tender_patch_store_test.json";
    ASSERT_TRUE(PatchStore::save_to_file(make_patch(), path.string()));

    PatchData loaded;
    ASSERT_TRUE(PatchStore::load_from_file(loaded, path.string()));
    EXPECT_EQ(loaded.name, "Glass Keys");
    EXPECT_EQ(loaded.params.waveform, static_cast<int>(Waveform::Triangle));

    std::filesystem::remove(path);
}

TEST(PatchStoreTest, MissingFileFails) {
    PatchData patch;
    EXPECT_FALSE(PatchStore::load_from_file(patch, "/nonexistent/dir/patch.json"));
    EXPECT_FALSE(PatchStore::save_to_file(patch, "/nonexistent/dir/patch.json"));
}
