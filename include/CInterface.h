/**
 * @file CInterface.h
 * @brief C-compatible API layer for hosts (GUI toolkits, Swift, .NET, Python).
 *
 * Every function returns -1 (or NULL) on failure and never lets a C++
 * exception cross the boundary.
 */

#ifndef MORPHO_C_INTERFACE_H
#define MORPHO_C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Band ids, in spectral order
enum MorphoBand {
    MORPHO_BAND_LOW      = 0,
    MORPHO_BAND_MID_LOW  = 1,
    MORPHO_BAND_MID_HIGH = 2,
    MORPHO_BAND_HIGH     = 3
};

enum MorphoPhase {
    MORPHO_PHASE_IDLE      = 0,
    MORPHO_PHASE_LOADING   = 1,
    MORPHO_PHASE_PLAYING   = 2,
    MORPHO_PHASE_PAUSED    = 3,
    MORPHO_PHASE_EXPORTING = 4
};

// Opaque handle type
typedef void* MorphoEngineHandle;

// Invoked from morpho_engine_tick() when playback reaches the end
typedef void (*MorphoEndedCallback)(void* user_data);

// Lifecycle. config_path may be NULL for defaults.
MorphoEngineHandle morpho_engine_create(const char* config_path);
MorphoEngineHandle morpho_engine_create_with_device(const char* config_path, unsigned int sample_rate);
void morpho_engine_destroy(MorphoEngineHandle handle);

// Loading
int morpho_engine_load_interleaved(MorphoEngineHandle handle, const float* data, size_t frames,
                                   unsigned int channels, unsigned int sample_rate);
int morpho_engine_load_file(MorphoEngineHandle handle, const char* path);

// Transport
int morpho_engine_play(MorphoEngineHandle handle);
int morpho_engine_pause(MorphoEngineHandle handle);
int morpho_engine_stop(MorphoEngineHandle handle);
int morpho_engine_seek(MorphoEngineHandle handle, double seconds);
int morpho_engine_set_ended_callback(MorphoEngineHandle handle, MorphoEndedCallback callback, void* user_data);

// Parameters
int morpho_engine_set_haas(MorphoEngineHandle handle, int enabled);
int morpho_engine_set_bypass(MorphoEngineHandle handle, int bypass);
int morpho_engine_set_width(MorphoEngineHandle handle, float width);
int morpho_engine_set_band_pan(MorphoEngineHandle handle, int band, float pan);
int morpho_engine_set_band_gain(MorphoEngineHandle handle, int band, float gain);
int morpho_engine_set_mono_safe_mode(MorphoEngineHandle handle, int enabled);

// Monitor tick (call at the configured rate, ~60 Hz)
int morpho_engine_tick(MorphoEngineHandle handle);

// Headless rendering: interleaved stereo, frames * 2 floats
int morpho_engine_process(MorphoEngineHandle handle, float* output, size_t frames);

// Device output (ALSA). Play and start_device fail (-1) if the device rate
// differs from the loaded buffer's sample rate.
int morpho_engine_start_device(MorphoEngineHandle handle);
int morpho_engine_stop_device(MorphoEngineHandle handle);

// Telemetry
double morpho_engine_get_current_time(MorphoEngineHandle handle);
double morpho_engine_get_duration(MorphoEngineHandle handle);
float morpho_engine_get_phase_correlation(MorphoEngineHandle handle);
float morpho_engine_get_width(MorphoEngineHandle handle);
int morpho_engine_get_haas(MorphoEngineHandle handle);
int morpho_engine_is_correcting(MorphoEngineHandle handle);
int morpho_engine_get_phase(MorphoEngineHandle handle);
int morpho_engine_get_time_domain(MorphoEngineHandle handle, float* left, float* right, size_t frames);

// Export: 0 with a malloc'd WAV in *out_data, 1 if nothing is loaded, -1 on error
int morpho_engine_export(MorphoEngineHandle handle, int bits, uint8_t** out_data, size_t* out_size);
void morpho_free_buffer(uint8_t* data);

// Logging passthrough
void morpho_log_message(const char* tag, const char* message);
void morpho_log_event(const char* tag, float value);

#ifdef __cplusplus
}
#endif

#endif // MORPHO_C_INTERFACE_H
