#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace harvest {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm utc_tm{};
  gmtime_r(&timestamp, &utc_tm);

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(cache_hit),
          TRACE_NAME(cache_miss),
          TRACE_NAME(fetch_start),
          TRACE_NAME(fetch_complete),
          TRACE_NAME(fetch_failed),
          TRACE_NAME(entry_released),
          TRACE_NAME(store_retry),
          TRACE_NAME(slot_acquired),
          TRACE_NAME(slot_released),
          TRACE_NAME(unit_start),
          TRACE_NAME(unit_complete),
          TRACE_NAME(unit_failed),
          TRACE_NAME(checkpoint_flushed),
          TRACE_NAME(instance_lock),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::cache_hit const &value) {
            std::ostringstream oss;
            oss << "cache_hit key=" << value.key << " source=" << value.source;
            return oss.str();
          },
          [](trace_events::cache_miss const &value) {
            std::ostringstream oss;
            oss << "cache_miss key=" << value.key;
            return oss.str();
          },
          [](trace_events::fetch_start const &value) {
            std::ostringstream oss;
            oss << "fetch_start key=" << value.key << " url=" << value.url;
            return oss.str();
          },
          [](trace_events::fetch_complete const &value) {
            std::ostringstream oss;
            oss << "fetch_complete key=" << value.key << " url=" << value.url
                << " bytes=" << value.bytes << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::fetch_failed const &value) {
            std::ostringstream oss;
            oss << "fetch_failed key=" << value.key << " url=" << value.url
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::entry_released const &value) {
            std::ostringstream oss;
            oss << "entry_released key=" << value.key;
            return oss.str();
          },
          [](trace_events::store_retry const &value) {
            std::ostringstream oss;
            oss << "store_retry name=" << value.name << " attempt=" << value.attempt
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::slot_acquired const &value) {
            std::ostringstream oss;
            oss << "slot_acquired unit=" << value.unit << " in_use=" << value.in_use
                << " wait_ms=" << value.wait_ms;
            return oss.str();
          },
          [](trace_events::slot_released const &value) {
            std::ostringstream oss;
            oss << "slot_released unit=" << value.unit << " in_use=" << value.in_use;
            return oss.str();
          },
          [](trace_events::unit_start const &value) {
            std::ostringstream oss;
            oss << "unit_start unit=" << value.unit << " urls=" << value.urls;
            return oss.str();
          },
          [](trace_events::unit_complete const &value) {
            std::ostringstream oss;
            oss << "unit_complete unit=" << value.unit
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::unit_failed const &value) {
            std::ostringstream oss;
            oss << "unit_failed unit=" << value.unit << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::checkpoint_flushed const &value) {
            std::ostringstream oss;
            oss << "checkpoint_flushed path=" << value.path << " units=" << value.units
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::instance_lock const &value) {
            std::ostringstream oss;
            oss << "instance_lock path=" << value.path
                << " acquired=" << bool_string(value.acquired);
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::cache_hit const &value) {
            append_kv(output, "key", value.key);
            append_kv(output, "source", value.source);
          },
          [&](trace_events::cache_miss const &value) {
            append_kv(output, "key", value.key);
          },
          [&](trace_events::fetch_start const &value) {
            append_kv(output, "key", value.key);
            append_kv(output, "url", value.url);
          },
          [&](trace_events::fetch_complete const &value) {
            append_kv(output, "key", value.key);
            append_kv(output, "url", value.url);
            append_kv(output, "bytes", value.bytes);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::fetch_failed const &value) {
            append_kv(output, "key", value.key);
            append_kv(output, "url", value.url);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::entry_released const &value) {
            append_kv(output, "key", value.key);
          },
          [&](trace_events::store_retry const &value) {
            append_kv(output, "name", value.name);
            append_kv(output, "attempt", static_cast<std::int64_t>(value.attempt));
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::slot_acquired const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "in_use", value.in_use);
            append_kv(output, "wait_ms", value.wait_ms);
          },
          [&](trace_events::slot_released const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "in_use", value.in_use);
          },
          [&](trace_events::unit_start const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "urls", value.urls);
          },
          [&](trace_events::unit_complete const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::unit_failed const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::checkpoint_flushed const &value) {
            append_kv(output, "path", value.path);
            append_kv(output, "units", value.units);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::instance_lock const &value) {
            append_kv(output, "path", value.path);
            append_kv(output, "acquired", value.acquired);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace harvest
