/**
 * @file main.cpp
 * @brief morpho_cli: offline export and live ALSA playback of the stereo enhancer.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <memory>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <cxxopts.hpp>
#include "ConfigStore.hpp"
#include "Engine.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "WavReader.hpp"
#include "alsa/AlsaDriver.hpp"

using namespace morpho;

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted = true;
}

/**
 * @brief Parse "band=value" (e.g. "mid-low=-0.4").
 */
bool parse_band_assignment(const std::string& text, BandId& id, float& value) {
    const auto eq = text.find('=');
    if (eq == std::string::npos) return false;
    const auto parsed = parse_band_id(text.substr(0, eq));
    if (!parsed) return false;
    try {
        value = std::stof(text.substr(eq + 1));
    } catch (const std::exception&) {
        return false;
    }
    id = *parsed;
    return true;
}

bool write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) return false;
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

void print_bands(const EngineState& state) {
    for (const auto& band : state.bands) {
        std::cout << "  " << std::setw(7) << band_display_name(band.id)
                  << " (" << band_range_label(band.id) << ")"
                  << "  pan " << std::showpos << std::fixed << std::setprecision(2) << band.pan
                  << std::noshowpos << "  gain " << band.gain
                  << "  effective " << std::showpos << effective_pan(band.pan, state.global_width)
                  << std::noshowpos << std::endl;
    }
}

int run_export(Engine& engine, const std::string& output, BitDepth depth) {
    std::cout << "[Export] Rendering " << engine.duration() << " s at "
              << static_cast<int>(depth) << " bit..." << std::endl;
    try {
        auto future = engine.export_audio_async(depth);
        while (future.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
            if (g_interrupted) engine.cancel_export();
        }
        auto bytes = future.get();
        AudioLogger::instance().drain(std::cout);
        if (!bytes) {
            std::cerr << "[Export] Nothing loaded" << std::endl;
            return 1;
        }
        if (!write_file(output, *bytes)) {
            std::cerr << "[Export] Cannot write " << output << std::endl;
            return 1;
        }
        std::cout << "[Export] Wrote " << bytes->size() << " bytes to " << output << std::endl;
        return 0;
    } catch (const RenderError& e) {
        AudioLogger::instance().drain(std::cout);
        std::cerr << "[Export] Failed (" << render_error_reason_name(e.reason()) << "): " << e.what() << std::endl;
        return 1;
    }
}

int run_playback(Engine& engine) {
    if (!engine.start_device()) {
        AudioLogger::instance().drain(std::cerr);
        std::cerr << "[Play] Cannot open ALSA device " << engine.config().alsa_device
                  << " at " << engine.config().sample_rate << " Hz" << std::endl;
        return 1;
    }

    std::atomic<bool> ended{false};
    if (!engine.play(engine.state().bands, [&ended]() { ended = true; })) {
        AudioLogger::instance().drain(std::cerr);
        engine.stop_device();
        return 1;
    }

    const auto period = std::chrono::microseconds(1000000 / engine.config().monitor_tick_hz);
    auto next_tick = std::chrono::steady_clock::now();
    auto next_report = next_tick;

    while (!ended && !g_interrupted) {
        next_tick += period;
        std::this_thread::sleep_until(next_tick);

        const auto now = std::chrono::steady_clock::now();
        engine.tick(now);
        AudioLogger::instance().drain(std::cout);

        if (now >= next_report) {
            next_report = now + std::chrono::milliseconds(250);
            std::cout << "\r[Play] " << std::fixed << std::setprecision(1) << engine.current_time()
                      << " / " << engine.duration() << " s  corr " << std::showpos << std::setprecision(2)
                      << engine.phase_correlation() << std::noshowpos
                      << "  width " << engine.state().global_width
                      << (engine.is_correcting(now) ? "  [AUTO-FIX]" : "            ") << std::flush;
        }
    }
    std::cout << std::endl;

    engine.stop();
    engine.stop_device();
    AudioLogger::instance().drain(std::cout);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("morpho_cli", "Mono-to-stereo spatial enhancer");
    options.add_options()
        ("input", "Input WAV file", cxxopts::value<std::string>())
        ("o,output", "Output WAV file", cxxopts::value<std::string>())
        ("bits", "Export bit depth (16, 24 or 32)", cxxopts::value<int>()->default_value("24"))
        ("width", "Global stereo width (0 .. max width)", cxxopts::value<float>())
        ("haas", "Enable the Haas micro-delay", cxxopts::value<bool>()->default_value("false"))
        ("bypass", "Bypass processing (dry signal only)", cxxopts::value<bool>()->default_value("false"))
        ("no-mono-safe", "Disable automatic phase correction", cxxopts::value<bool>()->default_value("false"))
        ("pan", "Band pan, BAND=VALUE (low, mid-low, mid-high, high)", cxxopts::value<std::vector<std::string>>())
        ("gain", "Band gain, BAND=VALUE", cxxopts::value<std::vector<std::string>>())
        ("config", "Engine config JSON", cxxopts::value<std::string>())
        ("play", "Play through ALSA instead of exporting", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print usage");
    options.parse_positional({"input"});
    options.positional_help("<input.wav>");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        std::cout << options.help() << std::endl;
        return 1;
    }

    if (result.count("help") || !result.count("input")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    const bool play = result["play"].as<bool>();
    if (!play && !result.count("output")) {
        std::cerr << "Either --output or --play is required" << std::endl;
        return 1;
    }

    const auto depth = bit_depth_from_int(result["bits"].as<int>());
    if (!depth) {
        std::cerr << "Unsupported bit depth " << result["bits"].as<int>() << " (use 16, 24 or 32)" << std::endl;
        return 1;
    }

    EngineConfig config;
    if (result.count("config") && !ConfigStore::load_from_file(config, result["config"].as<std::string>())) {
        std::cerr << "Continuing with default configuration" << std::endl;
    }

    const std::string input = result["input"].as<std::string>();
    PcmBuffer buffer;
    try {
        std::cout << "Reading input file: " << input << std::endl;
        buffer = WavReader::read_file(input);
    } catch (const DecodeError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "  - " << buffer.sample_rate << " Hz, " << buffer.num_channels() << " channel(s), "
              << buffer.duration() << " s" << std::endl;

    std::unique_ptr<hal::AudioDriver> driver;
    if (play) {
        config.sample_rate = buffer.sample_rate;
        config = config.sanitized();
        driver = std::make_unique<hal::AlsaDriver>(config.sample_rate, static_cast<int>(config.block_size), 2, config.alsa_device);
    }

    Engine engine(config, std::move(driver));
    if (!engine.load(std::move(buffer))) {
        std::cerr << "Input contains no audio" << std::endl;
        return 1;
    }

    if (result.count("width")) engine.set_width(result["width"].as<float>());
    engine.set_haas(result["haas"].as<bool>());
    engine.set_bypass(result["bypass"].as<bool>());
    engine.set_mono_safe_mode(!result["no-mono-safe"].as<bool>());

    if (result.count("pan")) {
        for (const auto& item : result["pan"].as<std::vector<std::string>>()) {
            BandId id = BandId::Low;
            float value = 0.0f;
            if (!parse_band_assignment(item, id, value)) {
                std::cerr << "Bad --pan value: " << item << std::endl;
                return 1;
            }
            engine.set_band_pan(id, value);
        }
    }
    if (result.count("gain")) {
        for (const auto& item : result["gain"].as<std::vector<std::string>>()) {
            BandId id = BandId::Low;
            float value = 0.0f;
            if (!parse_band_assignment(item, id, value)) {
                std::cerr << "Bad --gain value: " << item << std::endl;
                return 1;
            }
            engine.set_band_gain(id, value);
        }
    }

    std::cout << "Width " << engine.state().global_width
              << ", Haas " << (engine.state().haas_enabled ? "on" : "off")
              << ", bypass " << (engine.state().bypass ? "on" : "off") << std::endl;
    print_bands(engine.state());

    std::signal(SIGINT, on_signal);

    if (play) {
        return run_playback(engine);
    }
    return run_export(engine, result["output"].as<std::string>(), *depth);
}
