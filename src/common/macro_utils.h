#pragma once


namespace backstop {

#define BACKSTOP_DISALLOW_COPY(ClassName) \
    ClassName(const ClassName&) = delete; \
    ClassName& operator=(const ClassName&) = delete

#define BACKSTOP_DISALLOW_MOVE(ClassName) \
    ClassName(ClassName&&) = delete; \
    ClassName& operator=(ClassName&&) = delete

#define BACKSTOP_DISALLOW_COPY_AND_MOVE(ClassName) \
    BACKSTOP_DISALLOW_COPY(ClassName); \
    BACKSTOP_DISALLOW_MOVE(ClassName)

} // namespace backstop
