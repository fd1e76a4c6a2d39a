//
// Created by Malik T on 18/09/2025.
//

#include "PeerQuery.hpp"

#include <utility>

namespace cardroom::core::net
{
    namespace
    {
        auto HexValue(char c) -> int
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    }

    auto PercentDecode(std::string_view s) -> std::optional<std::string>
    {
        std::string out;
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] == '+')
            {
                out.push_back(' ');
            }
            else if (s[i] == '%')
            {
                if (i + 2 >= s.size()) return std::nullopt;
                int const hi = HexValue(s[i + 1]);
                int const lo = HexValue(s[i + 2]);
                if (hi < 0 || lo < 0) return std::nullopt;
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
            }
            else
            {
                out.push_back(s[i]);
            }
        }
        return out;
    }

    auto ParsePeerQuery(std::string_view resource) -> std::optional<PlayerInfo>
    {
        std::size_t const q = resource.find('?');
        if (q == std::string_view::npos) return std::nullopt;

        std::optional<std::string> peer{};
        std::optional<std::string> name{};
        std::string_view rest = resource.substr(q + 1);
        while (!rest.empty())
        {
            std::size_t const amp = rest.find('&');
            std::string_view const pair = rest.substr(0, amp);
            rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);

            std::size_t const eq = pair.find('=');
            if (eq == std::string_view::npos) continue;
            std::string_view const key = pair.substr(0, eq);
            std::optional<std::string> value = PercentDecode(pair.substr(eq + 1));
            if (!value) return std::nullopt;

            if (key == "peer") peer = std::move(value);
            else if (key == "name") name = std::move(value);
        }

        if (!peer || peer->empty()) return std::nullopt;
        PlayerInfo info{.id = *peer, .display_name = name && !name->empty() ? *name : *peer};
        return info;
    }
} // namespace cardroom::core::net
