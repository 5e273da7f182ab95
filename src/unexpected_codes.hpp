#pragma once

enum class UNEXPECTED_CODE {
  NOT_FOUND,
  INVALID_ARGUMENT,
  UNKNOWN
};
