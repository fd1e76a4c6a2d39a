//
// Created by Malik T on 05/09/2025.
//

#include "ComboFinder.hpp"

#include <algorithm>
#include <array>
#include <map>

#include "../core/Util.hpp"

namespace cardroom::core::eval
{
    namespace
    {
        constexpr uint8_t TopRankValue = 13; // the deuce, never part of a run
    }

    auto operator==(SlaveRuleset const& a, SlaveRuleset const& b) -> bool
    {
        return a.suit_tiebreak == b.suit_tiebreak && a.triple_beats_single == b.triple_beats_single
            && a.bomb_beats_any == b.bomb_beats_any && a.start == b.start;
    }

    auto SlaveRankValue(Rank const r) noexcept -> uint8_t
    {
        switch (r)
        {
        case Rank::Ace: return 12;
        case Rank::Two: return 13;
        default: return static_cast<uint8_t>(RankNumber(r) - 2);
        }
    }

    auto SlaveCardValue(Card const& c, bool const suit_tiebreak) noexcept -> uint16_t
    {
        uint16_t const rank = SlaveRankValue(c.rank());
        if (!suit_tiebreak) return rank;
        return static_cast<uint16_t>(rank * 10 + static_cast<uint16_t>(c.suit()) + 1);
    }

    auto ToString(SlavePlayType const t) -> std::string_view
    {
        switch (t)
        {
        case SlavePlayType::Single: return "single";
        case SlavePlayType::Pair: return "pair";
        case SlavePlayType::Triple: return "triple";
        case SlavePlayType::Quadruple: return "quadruple";
        case SlavePlayType::Run: return "run";
        }
        return "unknown";
    }

    auto SortSlaveHand(CardVec& hand) -> void
    {
        std::ranges::sort(hand, [](Card const& a, Card const& b)
        {
            return SlaveCardValue(a, true) < SlaveCardValue(b, true);
        });
    }

    auto ClassifyPlay(std::span<Card const> cards) -> std::optional<SlavePlayType>
    {
        if (cards.empty()) return std::nullopt;

        // Type detection looks at rank only.
        std::vector<uint8_t> ranks;
        ranks.reserve(cards.size());
        for (Card const& c : cards) ranks.push_back(SlaveRankValue(c.rank()));
        std::ranges::sort(ranks);
        bool const one_rank = ranks.front() == ranks.back();

        switch (cards.size())
        {
        case 1: return SlavePlayType::Single;
        case 2: if (one_rank) return SlavePlayType::Pair; break;
        case 3: if (one_rank) return SlavePlayType::Triple; break;
        case 4: if (one_rank) return SlavePlayType::Quadruple; break;
        default: break;
        }

        if (cards.size() < 3 || ranks.back() == TopRankValue) return std::nullopt;
        for (std::size_t i = 1; i < ranks.size(); ++i)
        {
            if (ranks[i] != ranks[i - 1] + 1) return std::nullopt;
        }
        return SlavePlayType::Run;
    }

    auto MakePlay(std::span<Card const> cards, SlaveRuleset const& rules) -> std::optional<SlavePlay>
    {
        std::optional<SlavePlayType> const type = ClassifyPlay(cards);
        if (!type) return std::nullopt;

        SlavePlay play{.cards = CardVec(cards.begin(), cards.end()), .type = *type, .value = 0};
        for (Card const& c : cards)
            play.value = std::max(play.value, SlaveCardValue(c, rules.suit_tiebreak));
        return play;
    }

    auto Beats(SlavePlay const& candidate, SlavePlay const& current, SlaveRuleset const& rules) -> bool
    {
        if (candidate.type == current.type)
        {
            if (candidate.type == SlavePlayType::Run && candidate.cards.size() != current.cards.size())
                return false;
            return candidate.value > current.value;
        }

        if (candidate.type == SlavePlayType::Quadruple)
        {
            if (rules.bomb_beats_any) return true;
            return current.type == SlavePlayType::Single || current.type == SlavePlayType::Pair;
        }

        return rules.triple_beats_single
            && candidate.type == SlavePlayType::Triple
            && current.type == SlavePlayType::Single;
    }

    namespace
    {
        // rank value -> cards of that rank, ascending by composite value
        auto ByRank(std::span<Card const> hand) -> std::map<uint8_t, CardVec>
        {
            std::map<uint8_t, CardVec> out;
            for (Card const& c : hand) out[SlaveRankValue(c.rank())].push_back(c);
            for (auto& [rank, cards] : out) SortSlaveHand(cards);
            return out;
        }
    }

    auto FindGroups(std::span<Card const> hand, std::size_t const k) -> std::vector<CardVec>
    {
        std::vector<CardVec> out;
        for (auto const& [rank, cards] : ByRank(hand))
        {
            if (cards.size() < k) continue;
            std::vector<CardVec> subsets = util::Combinations(cards, k);
            out.insert(out.end(), std::make_move_iterator(subsets.begin()), std::make_move_iterator(subsets.end()));
        }
        return out;
    }

    auto FindRuns(std::span<Card const> hand, std::size_t const min_len) -> std::vector<CardVec>
    {
        std::vector<CardVec> out;
        if (min_len == 0) return out;

        std::map<uint8_t, CardVec> const groups = ByRank(hand);
        std::vector<uint8_t> ranks;
        for (auto const& [rank, cards] : groups)
        {
            if (rank != TopRankValue) ranks.push_back(rank);
        }

        std::size_t i = 0;
        while (i < ranks.size())
        {
            // extend a maximal consecutive stretch [i, j)
            std::size_t j = i + 1;
            while (j < ranks.size() && ranks[j] == ranks[j - 1] + 1) ++j;

            std::size_t const stretch = j - i;
            for (std::size_t len = min_len; len <= stretch; ++len)
            {
                for (std::size_t start = i; start + len <= j; ++start)
                {
                    CardVec run;
                    run.reserve(len);
                    // highest-valued card of each rank
                    for (std::size_t r = start; r < start + len; ++r) run.push_back(groups.at(ranks[r]).back());
                    out.push_back(std::move(run));
                }
            }
            i = j;
        }
        return out;
    }

    auto FindAllPlays(std::span<Card const> hand) -> std::vector<CardVec>
    {
        std::vector<CardVec> out;
        for (std::size_t k = 1; k <= 4; ++k)
        {
            std::vector<CardVec> groups = FindGroups(hand, k);
            out.insert(out.end(), std::make_move_iterator(groups.begin()), std::make_move_iterator(groups.end()));
        }
        std::vector<CardVec> runs = FindRuns(hand, 3);
        out.insert(out.end(), std::make_move_iterator(runs.begin()), std::make_move_iterator(runs.end()));
        return out;
    }

    auto FindPlayable(std::span<Card const> hand,
                      std::optional<SlavePlay> const& current,
                      SlaveRuleset const& rules) -> std::vector<SlavePlay>
    {
        std::vector<SlavePlay> out;
        for (CardVec const& cards : FindAllPlays(hand))
        {
            std::optional<SlavePlay> play = MakePlay(cards, rules);
            if (!play) continue;
            if (!current || Beats(*play, *current, rules)) out.push_back(std::move(*play));
        }
        return out;
    }
}
