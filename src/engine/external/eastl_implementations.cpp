/*
 * Allocation and formatting hooks that EASTL expects the application to provide
 */

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>

void* operator new[](size_t size, const char* name, int flags, unsigned debug_flags, const char* file, int line) {
    return new uint8_t[size];
}

void* operator new[](
    size_t size, size_t alignment, size_t offset, const char* name, int flags, unsigned debug_flags, const char* file,
    int line
    ) {
    // operator new already aligns to alignof(max_align_t), which covers everything we put in EASTL containers
    return new uint8_t[size];
}

int Vsnprintf8(char* destination, size_t n, const char* format, va_list arguments) {
    return vsnprintf(destination, n, format, arguments);
}

int Vsnprintf16(char16_t* destination, size_t n, const char16_t* format, va_list arguments) {
    return 0;
}

int Vsnprintf32(char32_t* destination, size_t n, const char32_t* format, va_list arguments) {
    return 0;
}
