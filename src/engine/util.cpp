#include "util.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdint>
#include <uuid/uuid.h>

namespace docsync::engine {

    std::string now_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::time_t t = std::chrono::system_clock::to_time_t(now);

        std::tm tm{};
        gmtime_r(&t, &tm);

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
        return buffer;
    }

    std::string generate_id() {
        uuid_t uuid;
        uuid_generate_random(uuid);
        char out[37];
        uuid_unparse_lower(uuid, out);
        return out;
    }

    bool is_valid_utf8(const std::string& bytes) {
        const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
        size_t n = bytes.size();
        size_t i = 0;

        while (i < n) {
            unsigned char c = s[i];
            if (c < 0x80) {
                ++i;
                continue;
            }

            size_t len;
            uint32_t cp;
            if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
            else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
            else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
            else return false;

            if (i + len > n) return false;
            for (size_t k = 1; k < len; ++k) {
                if ((s[i + k] & 0xC0) != 0x80) return false;
                cp = (cp << 6) | (s[i + k] & 0x3F);
            }

            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
            i += len;
        }
        return true;
    }

}
