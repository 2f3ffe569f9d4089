#ifndef BEHAVE_BEHAVE_H
#define BEHAVE_BEHAVE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum behave_status {
  BEHAVE_OK = 0,
  BEHAVE_ERR_INVALID_ARGUMENT = 1,
  BEHAVE_ERR_PARSE_FAILED = 2,
  BEHAVE_ERR_IO = 3,
  BEHAVE_ERR_STRUCTURE = 4,
  BEHAVE_ERR_CONSISTENCY = 5,
  BEHAVE_ERR_NOT_FOUND = 6,
  BEHAVE_ERR_DUPLICATE = 7,
  BEHAVE_ERR_CONFIG = 8,
  BEHAVE_ERR_ENGINE_FAULT = 9
} behave_status;

// Persistence operations carried by the persist effect.
typedef enum behave_persist_op {
  BEHAVE_PERSIST_CREATE = 0,
  BEHAVE_PERSIST_UPDATE = 1,
  BEHAVE_PERSIST_DELETE = 2,
  BEHAVE_PERSIST_SAVE = 3
} behave_persist_op;

// Notification kinds carried by the notify effect.
typedef enum behave_notify_kind {
  BEHAVE_NOTIFY_SUCCESS = 0,
  BEHAVE_NOTIFY_ERROR = 1,
  BEHAVE_NOTIFY_INFO = 2,
  BEHAVE_NOTIFY_WARNING = 3
} behave_notify_kind;

#ifdef __cplusplus
}

namespace behave {

inline const char * status_name(const int32_t status) noexcept {
  switch (status) {
    case BEHAVE_OK:
      return "ok";
    case BEHAVE_ERR_INVALID_ARGUMENT:
      return "invalid_argument";
    case BEHAVE_ERR_PARSE_FAILED:
      return "parse_failed";
    case BEHAVE_ERR_IO:
      return "io";
    case BEHAVE_ERR_STRUCTURE:
      return "structure";
    case BEHAVE_ERR_CONSISTENCY:
      return "consistency";
    case BEHAVE_ERR_NOT_FOUND:
      return "not_found";
    case BEHAVE_ERR_DUPLICATE:
      return "duplicate";
    case BEHAVE_ERR_CONFIG:
      return "config";
    case BEHAVE_ERR_ENGINE_FAULT:
      return "engine_fault";
    default:
      return "unknown";
  }
}

}  // namespace behave
#endif

#endif
