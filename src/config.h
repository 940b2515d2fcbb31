#ifndef CONFIG_H
#define CONFIG_H

#ifdef __cplusplus
#include <cstdint>
#define namespace_std std::
#else
#include <stdint.h>
#define namespace_std
#endif

// largest symbol of the alphabet domain (Unicode scalar values by default)
#ifndef IREGEX_SYMBOL_MAX
#define IREGEX_SYMBOL_MAX 0x10FFFF
#endif

// ceiling on the number of states a single pipeline stage may allocate
#ifndef IREGEX_DEFAULT_STATE_LIMIT
#define IREGEX_DEFAULT_STATE_LIMIT 1000000
#endif

#if IREGEX_SYMBOL_MAX > 0xFFFFFFFF
#error "IREGEX_SYMBOL_MAX must fit in 32 bits"
#endif

typedef namespace_std uint32_t symbol_t;
typedef int state_id;

#undef namespace_std

#endif // CONFIG_H
