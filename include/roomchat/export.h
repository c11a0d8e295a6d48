#pragma once

#if defined(_WIN32) || defined(WIN32)
#define LIBROOMCHAT_EXPORT __declspec(dllexport)
#else
#define LIBROOMCHAT_EXPORT __attribute__((visibility("default")))
#endif
#define LIBROOMCHAT_C_API extern "C" LIBROOMCHAT_EXPORT
