// ============================================================================
// File: shared/common/result_helper.hpp
// Description: Result<T> helper macros
// Depends on: shared/common/result.h
// ============================================================================

#pragma once
#include "result.h"

// ----------------------------------------------------------------------------
// RETURN_IF_ERR
// ----------------------------------------------------------------------------
// 사용 예시:
//   auto r = definitions.registerDefinition(name, def);
//   RETURN_IF_ERR(r);
// ----------------------------------------------------------------------------
#define RETURN_IF_ERR(res)                                           \
    do {                                                             \
        if (!(res)) {                                                \
            return Result<void>::Error((res).code(), (res).error()); \
        }                                                            \
    } while (0)

// ----------------------------------------------------------------------------
// THROW_IF_ERR : Result 실패를 예외로 전환 (설정 단계용)
// ----------------------------------------------------------------------------
#define THROW_IF_ERR(res, ExceptionType)                                      \
    do {                                                                      \
        if (!(res)) {                                                         \
            throw ExceptionType((res).error().value_or(to_string((res).code()))); \
        }                                                                     \
    } while (0)
