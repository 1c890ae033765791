#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_DEVICE_IO
#include <miniaudio.h>
