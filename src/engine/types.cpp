#include "parts/types.hpp"

namespace parts::engine {

    namespace {
        int hex_value(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    }

    std::string Fingerprint::hex() const {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 2);
        for (uint8_t b : bytes) {
            out += digits[b >> 4];
            out += digits[b & 0x0f];
        }
        return out;
    }

    std::optional<Fingerprint> Fingerprint::from_hex(const std::string& text) {
        Fingerprint fp;
        if (text.size() != fp.bytes.size() * 2) return std::nullopt;
        for (size_t i = 0; i < fp.bytes.size(); ++i) {
            int hi = hex_value(text[i * 2]);
            int lo = hex_value(text[i * 2 + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            fp.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return fp;
    }

    const char* to_string(ChangeEntry::Kind kind) {
        switch (kind) {
            case ChangeEntry::Kind::Unchanged: return "unchanged";
            case ChangeEntry::Kind::Changed: return "changed";
            case ChangeEntry::Kind::Added: return "added";
            case ChangeEntry::Kind::Removed: return "removed";
            case ChangeEntry::Kind::Failed: return "failed";
        }
        return "unknown";
    }

    size_t ChangeReport::count(ChangeEntry::Kind kind) const {
        size_t n = 0;
        for (const auto& e : entries) {
            if (e.kind == kind) ++n;
        }
        return n;
    }

    size_t ChangeReport::changed_count() const {
        return count(ChangeEntry::Kind::Changed) + count(ChangeEntry::Kind::Added) +
               count(ChangeEntry::Kind::Removed);
    }

    const ChangeEntry* ChangeReport::find(const std::string& name) const {
        for (const auto& e : entries) {
            if (e.name == name) return &e;
        }
        return nullptr;
    }

}
