//
// Created by Malik T on 12/09/2025.
//

#include "codec.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace cardroom::core::net
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)Suit::Hearts == (int)fb::Suit::Hearts);
    static_assert((int)Rank::Ace == (int)fb::Rank::Ace);
    static_assert((int)Rank::King == (int)fb::Rank::King);
    static_assert((int)GameKind::Dummy == (int)fb::GameKind::Dummy);

    auto ToFbSuit(Suit const s) noexcept -> fb::Suit
    {
        switch (s)
        {
        case Suit::Clubs: return fb::Suit::Clubs;
        case Suit::Diamonds: return fb::Suit::Diamonds;
        case Suit::Hearts: return fb::Suit::Hearts;
        case Suit::Spades: return fb::Suit::Spades;
        }
        return fb::Suit::Clubs;
    }

    auto ToFbRank(Rank const r) noexcept -> fb::Rank
    {
        return static_cast<fb::Rank>(RankNumber(r));
    }

    auto ToFbKind(GameKind const k) noexcept -> fb::GameKind
    {
        switch (k)
        {
        case GameKind::PokDeng: return fb::GameKind::PokDeng;
        case GameKind::Kang: return fb::GameKind::Kang;
        case GameKind::Holdem: return fb::GameKind::Holdem;
        case GameKind::Blackjack: return fb::GameKind::Blackjack;
        case GameKind::Slave: return fb::GameKind::Slave;
        case GameKind::Dummy: return fb::GameKind::Dummy;
        }
        return fb::GameKind::PokDeng;
    }

    auto FromFbKind(fb::GameKind const k) noexcept -> std::optional<GameKind>
    {
        return EnumFromFb<GameKind>(k);
    }

    auto ToFbCard(Card const& c) noexcept -> fb::Card
    {
        return fb::Card(ToFbSuit(c.suit()), ToFbRank(c.rank()), c.copy());
    }

    auto FromFbCard(fb::Card const& c) noexcept -> std::optional<Card>
    {
        std::optional<Suit> const s = EnumFromFb<Suit>(c.suit());
        std::optional<Rank> const r = EnumFromFb<Rank>(c.rank());
        if (!s || !r || c.copy() >= constants::MaxDecks) return std::nullopt;
        return Card{*s, *r, c.copy()};
    }

    auto PackCards(flatbuffers::FlatBufferBuilder& fbb, std::span<Card const> cards)
        -> flatbuffers::Offset<flatbuffers::Vector<fb::Card const*>>
    {
        std::vector<fb::Card> out;
        out.reserve(cards.size());
        for (Card const& c : cards) out.push_back(ToFbCard(c));
        return fbb.CreateVectorOfStructs(out);
    }

    auto UnpackCards(flatbuffers::Vector<fb::Card const*> const* v) -> std::expected<CardVec, ParseError>
    {
        CardVec out;
        if (!v) return out;
        out.reserve(v->size());
        for (fb::Card const* c : *v)
        {
            std::optional<Card> const card = FromFbCard(*c);
            if (!card) return std::unexpected(ParseError{"card out of range"});
            out.push_back(*card);
        }
        return out;
    }

    auto PackDeck(flatbuffers::FlatBufferBuilder& fbb, DeckSnapshot const& d) -> flatbuffers::Offset<fb::Deck>
    {
        auto const undealt = PackCards(fbb, d.undealt);
        auto const dealt = PackCards(fbb, d.dealt);
        return fb::CreateDeck(fbb, undealt, dealt);
    }

    auto UnpackDeck(fb::Deck const* d) -> std::expected<DeckSnapshot, ParseError>
    {
        if (!d) return std::unexpected(ParseError{"snapshot without deck"});
        std::expected<CardVec, ParseError> undealt = UnpackCards(d->undealt());
        if (!undealt) return std::unexpected(undealt.error());
        std::expected<CardVec, ParseError> dealt = UnpackCards(d->dealt());
        if (!dealt) return std::unexpected(dealt.error());
        return DeckSnapshot{.undealt = std::move(*undealt), .dealt = std::move(*dealt)};
    }

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    auto Bytes(flatbuffers::Vector<std::uint8_t> const* v) -> std::vector<std::uint8_t>
    {
        if (!v) return {};
        return std::vector<std::uint8_t>(v->begin(), v->end());
    }

    auto SeatInRange(PlyrIdxT const idx, std::size_t const count) noexcept -> bool
    {
        return count == 0 ? idx == 0 : idx < count;
    }

    auto AsBytes(flatbuffers::DetachedBuffer const& buf) noexcept -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }

    auto OpenEnvelope(std::span<std::byte const> bytes) -> std::expected<fb::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* raw = reinterpret_cast<uint8_t const*>(bytes.data());
        if (!fb::EnvelopeBufferHasIdentifier(raw))
            return std::unexpected(ParseError{"bad file identifier"});

        flatbuffers::Verifier verifier(raw, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        auto const* env = fb::GetEnvelope(raw);
        if (!env || env->message_type() == fb::Message::NONE)
            return std::unexpected(ParseError{"empty envelope"});
        return env;
    }

    // ---------- Violation (host -> offending peer) ----------

    auto BuildViolation(std::string_view session_id,
                        error::RuleViolation const& v,
                        std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const sid = fbb.CreateString(session_id.data(), session_id.size());
        auto const who = fbb.CreateString(v.actor.value_or(PlayerId{}));
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fb::CreateViolation(fbb, msg_id, sid, static_cast<std::uint16_t>(v.code), who, txt);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::Violation, vio.Union());
        fb::FinishEnvelopeBuffer(fbb, env);
        return fbb.Release();
    }

    auto DecodeViolation(fb::Violation const& msg) -> ViolationFrame
    {
        using E = error::RuleViolationCode;
        auto const code = msg.code() <= static_cast<std::uint16_t>(E::Internal_Unreachable)
                              ? static_cast<E>(msg.code())
                              : E::Internal_Unreachable;
        return ViolationFrame{
            .msg_id = msg.msg_id(),
            .session_id = Str(msg.session_id()),
            .code = code,
            .actor = Str(msg.actor()),
            .text = Str(msg.text())
        };
    }
} // namespace cardroom::core::net
