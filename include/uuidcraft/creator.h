#pragma once

#include <uuidcraft/uuid.h>

namespace uuidcraft {

  // Creator that needs no input per call
  class NoArgumentsUuidCreator {
  public:
    virtual ~NoArgumentsUuidCreator() = default;
    virtual Uuid create() = 0;
  };

}  // namespace uuidcraft
