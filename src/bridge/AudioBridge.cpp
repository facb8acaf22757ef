/**
 * @file AudioBridge.cpp
 * @brief C-compatible API bridge for the engine.
 */

#include "CInterface.h"
#include "ConfigStore.hpp"
#include "Engine.hpp"
#include "Logger.hpp"
#include "alsa/AlsaDriver.hpp"
#include <cstdlib>
#include <cstring>
#include <memory>
#include <vector>

struct EngineHandleImpl {
    std::unique_ptr<morpho::Engine> engine;
    MorphoEndedCallback ended_callback = nullptr;
    void* ended_user_data = nullptr;

    // Planar scratch for morpho_engine_process
    std::vector<float> left;
    std::vector<float> right;

    EngineHandleImpl(const morpho::EngineConfig& config, std::unique_ptr<morpho::hal::AudioDriver> driver)
        : engine(std::make_unique<morpho::Engine>(config, std::move(driver)))
        , left(config.block_size, 0.0f)
        , right(config.block_size, 0.0f)
    {}

    void fire_ended() {
        if (ended_callback) ended_callback(ended_user_data);
    }
};

namespace {

morpho::EngineConfig load_config(const char* config_path) {
    morpho::EngineConfig config;
    if (config_path && *config_path) {
        // Defaults stay in place if the file is unreadable.
        morpho::ConfigStore::load_from_file(config, config_path);
    }
    return config.sanitized();
}

EngineHandleImpl* impl_of(MorphoEngineHandle handle) {
    return static_cast<EngineHandleImpl*>(handle);
}

} // namespace

extern "C" {

MorphoEngineHandle morpho_engine_create(const char* config_path) {
    try {
        return static_cast<MorphoEngineHandle>(new EngineHandleImpl(load_config(config_path), nullptr));
    } catch (...) { return nullptr; }
}

MorphoEngineHandle morpho_engine_create_with_device(const char* config_path, unsigned int sample_rate) {
    try {
        auto config = load_config(config_path);
        if (sample_rate > 0) config.sample_rate = static_cast<int>(sample_rate);
        config = config.sanitized();
        auto driver = std::make_unique<morpho::hal::AlsaDriver>(
            config.sample_rate, static_cast<int>(config.block_size), 2, config.alsa_device);
        return static_cast<MorphoEngineHandle>(new EngineHandleImpl(config, std::move(driver)));
    } catch (...) { return nullptr; }
}

void morpho_engine_destroy(MorphoEngineHandle handle) {
    delete impl_of(handle);
}

int morpho_engine_load_interleaved(MorphoEngineHandle handle, const float* data, size_t frames,
                                   unsigned int channels, unsigned int sample_rate) {
    if (!handle || !data || frames == 0 || channels == 0 || sample_rate == 0) return -1;
    try {
        auto buffer = morpho::PcmBuffer::from_interleaved(data, frames, channels, static_cast<int>(sample_rate));
        return impl_of(handle)->engine->load(std::move(buffer)) ? 0 : -1;
    } catch (...) { return -1; }
}

int morpho_engine_load_file(MorphoEngineHandle handle, const char* path) {
    if (!handle || !path) return -1;
    try {
        impl_of(handle)->engine->load_file(path);
        return 0;
    } catch (...) { return -1; }
}

int morpho_engine_play(MorphoEngineHandle handle) {
    if (!handle) return -1;
    auto* impl = impl_of(handle);
    try {
        const auto bands = impl->engine->state().bands;
        return impl->engine->play(bands, [impl]() { impl->fire_ended(); }) ? 0 : -1;
    } catch (...) { return -1; }
}

int morpho_engine_pause(MorphoEngineHandle handle) {
    if (!handle) return -1;
    try { impl_of(handle)->engine->pause(); return 0; } catch (...) { return -1; }
}

int morpho_engine_stop(MorphoEngineHandle handle) {
    if (!handle) return -1;
    try { impl_of(handle)->engine->stop(); return 0; } catch (...) { return -1; }
}

int morpho_engine_seek(MorphoEngineHandle handle, double seconds) {
    if (!handle) return -1;
    try { return impl_of(handle)->engine->seek(seconds) ? 0 : -1; } catch (...) { return -1; }
}

int morpho_engine_set_ended_callback(MorphoEngineHandle handle, MorphoEndedCallback callback, void* user_data) {
    if (!handle) return -1;
    auto* impl = impl_of(handle);
    impl->ended_callback = callback;
    impl->ended_user_data = user_data;
    return 0;
}

int morpho_engine_set_haas(MorphoEngineHandle handle, int enabled) {
    if (!handle) return -1;
    impl_of(handle)->engine->set_haas(enabled != 0);
    return 0;
}

int morpho_engine_set_bypass(MorphoEngineHandle handle, int bypass) {
    if (!handle) return -1;
    impl_of(handle)->engine->set_bypass(bypass != 0);
    return 0;
}

int morpho_engine_set_width(MorphoEngineHandle handle, float width) {
    if (!handle) return -1;
    impl_of(handle)->engine->set_width(width);
    return 0;
}

int morpho_engine_set_band_pan(MorphoEngineHandle handle, int band, float pan) {
    if (!handle || band < MORPHO_BAND_LOW || band > MORPHO_BAND_HIGH) return -1;
    impl_of(handle)->engine->set_band_pan(static_cast<morpho::BandId>(band), pan);
    return 0;
}

int morpho_engine_set_band_gain(MorphoEngineHandle handle, int band, float gain) {
    if (!handle || band < MORPHO_BAND_LOW || band > MORPHO_BAND_HIGH) return -1;
    impl_of(handle)->engine->set_band_gain(static_cast<morpho::BandId>(band), gain);
    return 0;
}

int morpho_engine_set_mono_safe_mode(MorphoEngineHandle handle, int enabled) {
    if (!handle) return -1;
    impl_of(handle)->engine->set_mono_safe_mode(enabled != 0);
    return 0;
}

int morpho_engine_tick(MorphoEngineHandle handle) {
    if (!handle) return -1;
    try { impl_of(handle)->engine->tick(); return 0; } catch (...) { return -1; }
}

int morpho_engine_process(MorphoEngineHandle handle, float* output, size_t frames) {
    if (!handle || !output || frames == 0) return -1;
    auto* impl = impl_of(handle);
    try {
        if (impl->left.size() < frames) {
            impl->left.resize(frames, 0.0f);
            impl->right.resize(frames, 0.0f);
        }
        morpho::AudioBuffer buffer{std::span<float>(impl->left.data(), frames),
                                   std::span<float>(impl->right.data(), frames)};
        impl->engine->render(buffer);
        for (size_t i = 0; i < frames; ++i) {
            output[2 * i] = buffer.left[i];
            output[2 * i + 1] = buffer.right[i];
        }
        return 0;
    } catch (...) { return -1; }
}

int morpho_engine_start_device(MorphoEngineHandle handle) {
    if (!handle) return -1;
    try { return impl_of(handle)->engine->start_device() ? 0 : -1; } catch (...) { return -1; }
}

int morpho_engine_stop_device(MorphoEngineHandle handle) {
    if (!handle) return -1;
    try { impl_of(handle)->engine->stop_device(); return 0; } catch (...) { return -1; }
}

double morpho_engine_get_current_time(MorphoEngineHandle handle) {
    return handle ? impl_of(handle)->engine->current_time() : 0.0;
}

double morpho_engine_get_duration(MorphoEngineHandle handle) {
    return handle ? impl_of(handle)->engine->duration() : 0.0;
}

float morpho_engine_get_phase_correlation(MorphoEngineHandle handle) {
    return handle ? impl_of(handle)->engine->phase_correlation() : 1.0f;
}

float morpho_engine_get_width(MorphoEngineHandle handle) {
    return handle ? impl_of(handle)->engine->state().global_width : 0.0f;
}

int morpho_engine_get_haas(MorphoEngineHandle handle) {
    if (!handle) return -1;
    return impl_of(handle)->engine->state().haas_enabled ? 1 : 0;
}

int morpho_engine_is_correcting(MorphoEngineHandle handle) {
    if (!handle) return -1;
    return impl_of(handle)->engine->is_correcting() ? 1 : 0;
}

int morpho_engine_get_phase(MorphoEngineHandle handle) {
    if (!handle) return -1;
    return static_cast<int>(impl_of(handle)->engine->phase());
}

int morpho_engine_get_time_domain(MorphoEngineHandle handle, float* left, float* right, size_t frames) {
    if (!handle || !left || !right) return -1;
    const size_t copied = impl_of(handle)->engine->time_domain_samples(
        std::span<float>(left, frames), std::span<float>(right, frames));
    return static_cast<int>(copied);
}

int morpho_engine_export(MorphoEngineHandle handle, int bits, uint8_t** out_data, size_t* out_size) {
    if (!handle || !out_data || !out_size) return -1;
    *out_data = nullptr;
    *out_size = 0;
    const auto depth = morpho::bit_depth_from_int(bits);
    if (!depth) return -1;
    try {
        auto result = impl_of(handle)->engine->export_audio(*depth);
        if (!result) return 1;

        auto* data = static_cast<uint8_t*>(std::malloc(result->size()));
        if (!data) return -1;
        std::memcpy(data, result->data(), result->size());
        *out_data = data;
        *out_size = result->size();
        return 0;
    } catch (...) { return -1; }
}

void morpho_free_buffer(uint8_t* data) {
    std::free(data);
}

void morpho_log_message(const char* tag, const char* message) {
    if (!tag || !message) return;
    morpho::AudioLogger::instance().log_message(tag, message);
}

void morpho_log_event(const char* tag, float value) {
    if (!tag) return;
    morpho::AudioLogger::instance().log_event(tag, value);
}

} // extern "C"
