#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace harvest {

namespace trace_events {

struct cache_hit {
  std::string key;
  std::string source;  // "memory" or "store"
};

struct cache_miss {
  std::string key;
};

struct fetch_start {
  std::string key;
  std::string url;
};

struct fetch_complete {
  std::string key;
  std::string url;
  std::int64_t bytes;
  std::int64_t duration_ms;
};

struct fetch_failed {
  std::string key;
  std::string url;
  std::string reason;
};

struct entry_released {
  std::string key;
};

struct store_retry {
  std::string name;
  int attempt;
  std::string reason;
};

struct slot_acquired {
  std::string unit;
  std::int64_t in_use;
  std::int64_t wait_ms;
};

struct slot_released {
  std::string unit;
  std::int64_t in_use;
};

struct unit_start {
  std::string unit;
  std::int64_t urls;
};

struct unit_complete {
  std::string unit;
  std::int64_t duration_ms;
};

struct unit_failed {
  std::string unit;
  std::string reason;
};

struct checkpoint_flushed {
  std::string path;
  std::int64_t units;
  std::int64_t duration_ms;
};

struct instance_lock {
  std::string path;
  bool acquired;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::cache_hit,
                                   trace_events::cache_miss,
                                   trace_events::fetch_start,
                                   trace_events::fetch_complete,
                                   trace_events::fetch_failed,
                                   trace_events::entry_released,
                                   trace_events::store_retry,
                                   trace_events::slot_acquired,
                                   trace_events::slot_released,
                                   trace_events::unit_start,
                                   trace_events::unit_complete,
                                   trace_events::unit_failed,
                                   trace_events::checkpoint_flushed,
                                   trace_events::instance_lock>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);
inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace harvest

#define HARVEST_TRACE_UNLIKELY [[unlikely]]

#define HARVEST_TRACE_EMIT(event_expr) \
  do { \
    if (::harvest::tui::g_trace_enabled) HARVEST_TRACE_UNLIKELY { \
        ::harvest::tui::trace event_expr; \
      } \
  } while (0)

#define HARVEST_TRACE_CACHE_HIT(key_value, source_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::cache_hit{ \
      .key = (key_value), \
      .source = (source_value), \
  }))

#define HARVEST_TRACE_CACHE_MISS(key_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::cache_miss{ .key = (key_value) }))

#define HARVEST_TRACE_FETCH_START(key_value, url_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::fetch_start{ \
      .key = (key_value), \
      .url = (url_value), \
  }))

#define HARVEST_TRACE_FETCH_COMPLETE(key_value, url_value, bytes_value, duration_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::fetch_complete{ \
      .key = (key_value), \
      .url = (url_value), \
      .bytes = static_cast<std::int64_t>(bytes_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define HARVEST_TRACE_FETCH_FAILED(key_value, url_value, reason_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::fetch_failed{ \
      .key = (key_value), \
      .url = (url_value), \
      .reason = (reason_value), \
  }))

#define HARVEST_TRACE_ENTRY_RELEASED(key_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::entry_released{ .key = (key_value) }))

#define HARVEST_TRACE_STORE_RETRY(name_value, attempt_value, reason_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::store_retry{ \
      .name = (name_value), \
      .attempt = (attempt_value), \
      .reason = (reason_value), \
  }))

#define HARVEST_TRACE_SLOT_ACQUIRED(unit_value, in_use_value, wait_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::slot_acquired{ \
      .unit = (unit_value), \
      .in_use = static_cast<std::int64_t>(in_use_value), \
      .wait_ms = static_cast<std::int64_t>(wait_value), \
  }))

#define HARVEST_TRACE_SLOT_RELEASED(unit_value, in_use_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::slot_released{ \
      .unit = (unit_value), \
      .in_use = static_cast<std::int64_t>(in_use_value), \
  }))

#define HARVEST_TRACE_UNIT_START(unit_value, urls_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::unit_start{ \
      .unit = (unit_value), \
      .urls = static_cast<std::int64_t>(urls_value), \
  }))

#define HARVEST_TRACE_UNIT_COMPLETE(unit_value, duration_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::unit_complete{ \
      .unit = (unit_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define HARVEST_TRACE_UNIT_FAILED(unit_value, reason_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::unit_failed{ \
      .unit = (unit_value), \
      .reason = (reason_value), \
  }))

#define HARVEST_TRACE_CHECKPOINT_FLUSHED(path_value, units_value, duration_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::checkpoint_flushed{ \
      .path = (path_value), \
      .units = static_cast<std::int64_t>(units_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define HARVEST_TRACE_INSTANCE_LOCK(path_value, acquired_value) \
  HARVEST_TRACE_EMIT((::harvest::trace_events::instance_lock{ \
      .path = (path_value), \
      .acquired = (acquired_value), \
  }))
