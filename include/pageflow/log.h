#pragma once

/// Logging for pagination runs. Break decisions go to PF_LOGD and the
/// per-run summary to PF_LOGI. Host failures and degraded results use PF_LOGW.
/// Android: __android_log_print. Elsewhere: stderr.

#ifdef __ANDROID__

#include <android/log.h>

#define PF_LOG_TAG "Pageflow"
#define PF_LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, PF_LOG_TAG, __VA_ARGS__)
#define PF_LOGI(...) __android_log_print(ANDROID_LOG_INFO,  PF_LOG_TAG, __VA_ARGS__)
#define PF_LOGW(...) __android_log_print(ANDROID_LOG_WARN,  PF_LOG_TAG, __VA_ARGS__)

#else

#include <cstdio>

#define PF_LOGD(fmt, ...) fprintf(stderr, "[Pageflow D] " fmt "\n", ##__VA_ARGS__)
#define PF_LOGI(fmt, ...) fprintf(stderr, "[Pageflow I] " fmt "\n", ##__VA_ARGS__)
#define PF_LOGW(fmt, ...) fprintf(stderr, "[Pageflow W] " fmt "\n", ##__VA_ARGS__)

#endif
