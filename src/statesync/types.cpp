// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "statesync/types.hpp"

namespace statesync {

const char *PriorityToString(Priority priority) {
  switch (priority) {
  case Priority::Fetch:
    return "fetch";
  case Priority::Stash:
    return "stash";
  case Priority::Drop:
    return "drop";
  }
  return "unknown";
}

} // namespace statesync
