#pragma once

/*
 * C interface of the soksak speech bridge.
 *
 * Every operation returns immediately; results are delivered through the
 * supplied callbacks on a bridge worker thread. The only exception is a
 * translation whose source language cannot be detected, which fails on the
 * calling thread before soksak_translate returns.
 *
 * Strings passed to callbacks are owned by the bridge and valid only for
 * the duration of the callback. Copy them if they are needed later.
 */

#if defined(_WIN32)
#  if defined(SOKSAK_BUILDING_LIBRARY)
#    define SOKSAK_API __declspec(dllexport)
#  else
#    define SOKSAK_API __declspec(dllimport)
#  endif
#else
#  define SOKSAK_API __attribute__((visibility("default")))
#endif

#define SOKSAK_BRIDGE_VERSION "0.1.0"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct soksak_context soksak_context;

/*
 * Transcription result. Called zero or more times with a segment
 * (text != NULL, error == NULL, times in seconds, non-decreasing), then
 * exactly once with text == NULL:
 *   error == NULL  transcription finished successfully
 *   error != NULL  transcription failed, error describes why
 * The terminal call is always the last call for a request.
 */
typedef void (*soksak_transcribe_result_callback)(const char* text,
                                                  const char* error,
                                                  double start_seconds,
                                                  double end_seconds,
                                                  void* user_data);

/* Progress in percent, 0 to 100. May be called zero or more times. */
typedef void (*soksak_transcribe_progress_callback)(double percent, void* user_data);

/*
 * Translation result. Called exactly once per request with either the
 * translated text or an error message.
 */
typedef void (*soksak_translate_result_callback)(void* user_data,
                                                 const char* translated_text,
                                                 const char* error);

/*
 * Create a context. model_path (a ggml model file or a folder containing
 * one) takes precedence over model_name (e.g. "base"). language fixes the
 * transcription language; NULL or "" auto-detects. The engine is loaded on
 * first use. Release with soksak_release_context.
 */
SOKSAK_API soksak_context* soksak_create_context(const char* model_path,
                                                 const char* model_name,
                                                 const char* language);

/* Release a context. Requests already running keep it alive until they finish. */
SOKSAK_API void soksak_release_context(soksak_context* context);

SOKSAK_API void soksak_transcribe(soksak_context* context,
                                  const char* audio_path,
                                  soksak_transcribe_result_callback result_callback,
                                  soksak_transcribe_progress_callback progress_callback,
                                  void* user_data);

/* source_lang NULL or "" detects the source language from text. */
SOKSAK_API void soksak_translate(const char* text,
                                 const char* source_lang,
                                 const char* target_lang,
                                 void* user_data,
                                 soksak_translate_result_callback result_callback);

/* Load runtime configuration from a JSON file. Returns 0 on success, -1 on failure. */
SOKSAK_API int soksak_configure(const char* config_path);

SOKSAK_API const char* soksak_version(void);

#ifdef __cplusplus
}
#endif
