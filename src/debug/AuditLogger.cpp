//
// Created by Malik T on 22/09/2025.
//

#include "AuditLogger.hpp"

#include <fmt/format.h>

#include "../core/Util.hpp"

namespace
{
    using namespace cardroom::core;

    auto s_cards(std::span<Card const> cards) -> std::string
    {
        std::string body;
        for (std::size_t i = 0; i < cards.size(); ++i)
        {
            body += (i ? "," : "");
            body += util::ToString(cards[i]);
        }
        return body;
    }
} // anonymous namespace

namespace cardroom::core::debug
{
    auto DescribeAction(PlaceBetAction const& a) -> std::string { return fmt::format("Bet({})", a.amount); }
    auto DescribeAction(FoldAction const&) -> std::string { return "Fold"; }
    auto DescribeAction(DrawCardAction const&) -> std::string { return "Draw"; }
    auto DescribeAction(StayAction const&) -> std::string { return "Stay"; }

    auto DescribeAction(DiscardAction const& a) -> std::string
    {
        std::string body;
        for (std::size_t i = 0; i < a.indices.size(); ++i)
            body += fmt::format("{}{}", i ? "," : "", static_cast<int>(a.indices[i]));
        return fmt::format("Discard[{}]", body);
    }

    auto DescribeAction(KeepAllAction const&) -> std::string { return "KeepAll"; }
    auto DescribeAction(CheckAction const&) -> std::string { return "Check"; }
    auto DescribeAction(CallAction const&) -> std::string { return "Call"; }
    auto DescribeAction(RaiseAction const& a) -> std::string { return fmt::format("Raise({})", a.amount); }
    auto DescribeAction(AllInAction const&) -> std::string { return "AllIn"; }
    auto DescribeAction(HitAction const& a) -> std::string { return fmt::format("Hit(h{})", static_cast<int>(a.hand)); }

    auto DescribeAction(StandAction const& a) -> std::string
    {
        return fmt::format("Stand(h{})", static_cast<int>(a.hand));
    }

    auto DescribeAction(DoubleAction const& a) -> std::string
    {
        return fmt::format("Double(h{})", static_cast<int>(a.hand));
    }

    auto DescribeAction(SplitAction const& a) -> std::string
    {
        return fmt::format("Split(h{})", static_cast<int>(a.hand));
    }

    auto DescribeAction(SurrenderAction const&) -> std::string { return "Surrender"; }
    auto DescribeAction(PlayCardsAction const& a) -> std::string { return fmt::format("Play[{}]", s_cards(a.cards)); }
    auto DescribeAction(PassAction const&) -> std::string { return "Pass"; }
    auto DescribeAction(DrawStockAction const&) -> std::string { return "DrawStock"; }
    auto DescribeAction(DrawDiscardAction const&) -> std::string { return "DrawDiscard"; }

    auto DescribeAction(DiscardCardAction const& a) -> std::string
    {
        return fmt::format("Discard({})", util::ToString(a.card));
    }

    auto DescribeAction(MeldAction const& a) -> std::string { return fmt::format("Meld[{}]", s_cards(a.cards)); }

    auto DescribeAction(LayOffAction const& a) -> std::string
    {
        return fmt::format("LayOff({}->m{})", util::ToString(a.card), a.meld_id);
    }

    auto DescribeAction(KnockAction const&) -> std::string { return "Knock"; }

    AuditLogger::AuditLogger(std::string path)
        : out_(std::move(path), std::ios::out | std::ios::trunc)
    {
    }

    AuditLogger::~AuditLogger() = default;

    auto AuditLogger::start(GameKind const game, std::uint64_t const seed, std::size_t const players) -> void
    {
        out_ << fmt::format("Game={}\n", ToString(game));
        out_ << fmt::format("Seed={}\n", seed);
        out_ << fmt::format("Players={}\n", players);
        out_.flush();
    }

    auto AuditLogger::round(std::uint32_t const number) -> void
    {
        out_ << fmt::format("Round {}\n", number);
    }

    auto AuditLogger::turn(PlayerId const& actor, std::string_view phase, std::string const& action) -> void
    {
        ++turns_;
        out_ << fmt::format("Turn actor={} phase={} action={}\n", actor, phase, action);
    }

    auto AuditLogger::outcome(error::ValidateResult const& r) -> void
    {
        out_ << fmt::format("Outcome: {}\n", r ? std::string{"Applied"} : error::describe(r.error()));
    }

    auto AuditLogger::end(std::string_view result) -> void
    {
        out_ << fmt::format("Result: {}\n", result);
        out_.flush();
    }

    auto AuditLogger::flush() -> void
    {
        out_.flush();
    }
} // namespace cardroom::core::debug
