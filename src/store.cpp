// ============================================================================
// store.cpp — shared helpers for meshview/store.hpp
// ============================================================================
#include "meshview/store.hpp"

namespace meshview {

const char* store_status_name(StoreStatus st) {
  switch (st) {
    case StoreStatus::Ok:     return "ok";
    case StoreStatus::Busy:   return "busy";
    case StoreStatus::Failed: return "failed";
  }
  return "failed";
}

} // namespace meshview
