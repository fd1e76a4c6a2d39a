//
// Created by Malik T on 22/09/2025.
//

#ifndef CARDROOM_AUDITLOGGER_HPP
#define CARDROOM_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <variant>

#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace cardroom::core::debug
{
    // One line per intent alternative, e.g. "Bet(20)", "Play[3C,3D]".
    auto DescribeAction(PlaceBetAction const& a) -> std::string;
    auto DescribeAction(FoldAction const& a) -> std::string;
    auto DescribeAction(DrawCardAction const& a) -> std::string;
    auto DescribeAction(StayAction const& a) -> std::string;
    auto DescribeAction(DiscardAction const& a) -> std::string;
    auto DescribeAction(KeepAllAction const& a) -> std::string;
    auto DescribeAction(CheckAction const& a) -> std::string;
    auto DescribeAction(CallAction const& a) -> std::string;
    auto DescribeAction(RaiseAction const& a) -> std::string;
    auto DescribeAction(AllInAction const& a) -> std::string;
    auto DescribeAction(HitAction const& a) -> std::string;
    auto DescribeAction(StandAction const& a) -> std::string;
    auto DescribeAction(DoubleAction const& a) -> std::string;
    auto DescribeAction(SplitAction const& a) -> std::string;
    auto DescribeAction(SurrenderAction const& a) -> std::string;
    auto DescribeAction(PlayCardsAction const& a) -> std::string;
    auto DescribeAction(PassAction const& a) -> std::string;
    auto DescribeAction(DrawStockAction const& a) -> std::string;
    auto DescribeAction(DrawDiscardAction const& a) -> std::string;
    auto DescribeAction(DiscardCardAction const& a) -> std::string;
    auto DescribeAction(MeldAction const& a) -> std::string;
    auto DescribeAction(LayOffAction const& a) -> std::string;
    auto DescribeAction(KnockAction const& a) -> std::string;

    template <typename... Ts>
    auto DescribeAction(std::variant<Ts...> const& a) -> std::string
    {
        return std::visit([](auto const& act) { return DescribeAction(act); }, a);
    }

    // Plain-text transcript of a self-play session.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (game, seed, player count)
        auto start(GameKind game, std::uint64_t seed, std::size_t players) -> void;

        // Round header
        auto round(std::uint32_t number) -> void;

        // Per intent, before Apply
        auto turn(PlayerId const& actor, std::string_view phase, std::string const& action) -> void;

        // After Apply
        auto outcome(error::ValidateResult const& r) -> void;

        // Footer with a free-form result line (payouts, finishing order, ...)
        auto end(std::string_view result) -> void;

        auto flush() -> void;

        [[nodiscard]] auto Turns() const noexcept -> std::size_t { return turns_; }

    private:
        std::ofstream out_;
        std::size_t turns_{0};
    };
}

#endif //CARDROOM_AUDITLOGGER_HPP
