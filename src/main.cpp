/**
 * @file main.cpp
 * @brief tender_play: plays a short arpeggio through the default ALSA device.
 *
 * Usage: tender_play [patch.json]
 */

#include <array>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <span>
#include <thread>
#include "AudioSettings.hpp"
#include "Logger.hpp"
#include "PatchStore.hpp"
#include "SynthEngine.hpp"
#include "alsa/AlsaDriver.hpp"

using namespace tender;

namespace {

std::atomic<bool> g_keep_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_keep_running = false;
    }
}

struct Step {
    int note;
    float velocity;
    int hold_ms;
};

// C major arpeggio up and down, then a held chord.
constexpr std::array<Step, 8> kArpeggio = {{
    {60, 0.8f, 250}, {64, 0.7f, 250}, {67, 0.7f, 250}, {72, 0.9f, 250},
    {67, 0.7f, 250}, {64, 0.7f, 250}, {60, 0.8f, 250}, {55, 0.6f, 500},
}};

void drain_logger() {
    AudioLogger::instance().drain(std::cout);
}

bool push_note(NoteQueue& queue, const NoteEvent& event) {
    if (!queue.push(event)) {
        std::cerr << "[tender_play] Note queue full, dropping note " << event.note << std::endl;
        return false;
    }
    return true;
}

void wait_ms(int ms) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (g_keep_running && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        drain_logger();
    }
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);

    PatchData patch;
    patch.name = "Default";
    if (argc > 1 && !PatchStore::load_from_file(patch, argv[1])) {
        std::cerr << "[tender_play] Using default patch" << std::endl;
        patch = PatchData{};
        patch.name = "Default";
    }
    std::cout << "[tender_play] Patch '" << patch.name << "': "
              << waveform_name(waveform_from_index(patch.params.waveform))
              << " A=" << patch.params.attack_ms << "ms D=" << patch.params.decay_ms
              << "ms S=" << patch.params.sustain_level << " R=" << patch.params.release_ms
              << "ms gain=" << patch.params.gain << std::endl;

    const auto requested = AudioSettings::instance().current();
    hal::AlsaDriver driver(requested.sample_rate, requested.block_size, requested.num_channels, "default");

    // start() negotiates the real rate, so the engine is built afterwards and
    // published to the callback through an atomic pointer.
    std::unique_ptr<SynthEngine> engine;
    std::atomic<SynthEngine*> live_engine{nullptr};
    NoteQueue notes;
    const SynthParams params = patch.params;

    driver.set_stereo_callback([&](AudioBuffer& output) {
        SynthEngine* synth = live_engine.load(std::memory_order_acquire);
        if (synth == nullptr) {
            output.clear();
            return;
        }
        synth->apply_parameters(params);
        synth->apply_queued(notes);
        synth->render(std::span<const NoteEvent>{}, output);
    });

    if (!driver.start()) {
        std::cerr << "[tender_play] Failed to start audio driver" << std::endl;
        return 1;
    }

    const auto negotiated = AudioSettings::instance().current();
    std::cout << "[tender_play] Rendering at " << negotiated.sample_rate << " Hz, "
              << negotiated.block_size << " frames per block" << std::endl;
    engine = std::make_unique<SynthEngine>(negotiated.sample_rate);
    live_engine.store(engine.get(), std::memory_order_release);

    for (const auto& step : kArpeggio) {
        if (!g_keep_running) break;
        push_note(notes, NoteEvent::note_on(step.note, step.velocity));
        wait_ms(step.hold_ms);
        push_note(notes, NoteEvent::note_off(step.note));
    }

    if (g_keep_running) {
        for (int note : {60, 64, 67}) {
            push_note(notes, NoteEvent::note_on(note, 0.6f));
        }
        wait_ms(1500);
        for (int note : {60, 64, 67}) {
            push_note(notes, NoteEvent::note_off(note));
        }
    }

    // Let the release tail ring out
    wait_ms(release_tail_ms(params) + 200);

    driver.stop();
    live_engine.store(nullptr, std::memory_order_release);
    drain_logger();

    auto metrics = engine->voices().get_metrics();
    std::cout << "[tender_play] Voice pool: max block " << metrics.max_execution_time.count()
              << " ns over " << metrics.total_blocks_processed << " blocks" << std::endl;
    if (AudioLogger::instance().dropped_count() > 0) {
        std::cout << "[tender_play] Dropped log entries: " << AudioLogger::instance().dropped_count() << std::endl;
    }

    return 0;
}
