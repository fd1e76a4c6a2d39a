//
// Created by Malik T on 12/09/2025.
//

#ifndef CARDROOM_CODEC_HPP
#define CARDROOM_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Deck.hpp"
#include "../core/Exception.hpp"
#include "../core/PokDengGame.hpp"
#include "../core/KangGame.hpp"
#include "../core/HoldemGame.hpp"
#include "../core/BlackjackGame.hpp"
#include "../core/SlaveGame.hpp"
#include "../core/DummyGame.hpp"

#include "generated/flatbuffers/cardroom_net_generated.h"

namespace cardroom::core::net
{
    namespace fb = cardroom::gen::net;

    struct ParseError
    {
        std::string message;
    };

    template <typename Game>
    struct ActionFrame
    {
        std::uint64_t msg_id{};
        std::string session_id;
        PlayerId actor;
        typename Game::Action action{};
    };

    template <typename Game>
    struct SnapshotFrame
    {
        std::uint64_t msg_id{};
        std::string session_id;
        typename Game::Snapshot snapshot{};
    };

    struct ViolationFrame
    {
        std::uint64_t msg_id{};
        std::string session_id;
        error::RuleViolationCode code{};
        PlayerId actor;
        std::string text;
    };

    // Core and schema enums share values; anything outside the schema range is rejected.
    template <typename To, typename From>
    auto EnumFromFb(From v) noexcept -> std::optional<To>
    {
        using U = std::underlying_type_t<From>;
        U const raw = static_cast<U>(v);
        if (raw < static_cast<U>(From::MIN) || raw > static_cast<U>(From::MAX)) return std::nullopt;
        return static_cast<To>(raw);
    }

    auto ToFbSuit(Suit s) noexcept -> fb::Suit;
    auto ToFbRank(Rank r) noexcept -> fb::Rank;
    auto ToFbKind(GameKind k) noexcept -> fb::GameKind;
    auto FromFbKind(fb::GameKind k) noexcept -> std::optional<GameKind>;

    auto ToFbCard(Card const& c) noexcept -> fb::Card;
    auto FromFbCard(fb::Card const& c) noexcept -> std::optional<Card>;

    auto PackCards(flatbuffers::FlatBufferBuilder& fbb, std::span<Card const> cards)
        -> flatbuffers::Offset<flatbuffers::Vector<fb::Card const*>>;
    // Absent vector decodes to no cards.
    auto UnpackCards(flatbuffers::Vector<fb::Card const*> const* v) -> std::expected<CardVec, ParseError>;

    auto PackDeck(flatbuffers::FlatBufferBuilder& fbb, DeckSnapshot const& d) -> flatbuffers::Offset<fb::Deck>;
    auto UnpackDeck(fb::Deck const* d) -> std::expected<DeckSnapshot, ParseError>;

    auto Str(flatbuffers::String const* s) -> std::string;
    auto Bytes(flatbuffers::Vector<std::uint8_t> const* v) -> std::vector<std::uint8_t>;
    // Seat indices must address an existing player (or be zero at an empty table).
    auto SeatInRange(PlyrIdxT idx, std::size_t count) noexcept -> bool;

    auto AsBytes(flatbuffers::DetachedBuffer const& buf) noexcept -> std::span<std::byte const>;

    // Verifies the buffer and its file identifier before handing out the root.
    auto OpenEnvelope(std::span<std::byte const> bytes) -> std::expected<fb::Envelope const*, ParseError>;

    auto BuildViolation(std::string_view session_id,
                        error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;
    auto DecodeViolation(fb::Violation const& msg) -> ViolationFrame;

    // Per-game mapping between engine values and the schema. One specialization per engine.
    template <typename Game>
    struct GameCodec;

    template <>
    struct GameCodec<PokDengGame>
    {
        static constexpr fb::GameState StateTag = fb::GameState::PokDengState;
        static constexpr fb::GameAction ActionTag = fb::GameAction::PokDengIntent;

        static auto PackState(flatbuffers::FlatBufferBuilder& fbb, PokDengState const& s) -> flatbuffers::Offset<void>;
        static auto UnpackState(fb::SnapshotMsg const& msg) -> std::expected<PokDengState, ParseError>;
        static auto PackAction(flatbuffers::FlatBufferBuilder& fbb, PokDengAction const& a) -> flatbuffers::Offset<void>;
        static auto UnpackAction(fb::ActionMsg const& msg) -> std::expected<PokDengAction, ParseError>;
    };

    template <>
    struct GameCodec<KangGame>
    {
        static constexpr fb::GameState StateTag = fb::GameState::KangState;
        static constexpr fb::GameAction ActionTag = fb::GameAction::KangIntent;

        static auto PackState(flatbuffers::FlatBufferBuilder& fbb, KangState const& s) -> flatbuffers::Offset<void>;
        static auto UnpackState(fb::SnapshotMsg const& msg) -> std::expected<KangState, ParseError>;
        static auto PackAction(flatbuffers::FlatBufferBuilder& fbb, KangAction const& a) -> flatbuffers::Offset<void>;
        static auto UnpackAction(fb::ActionMsg const& msg) -> std::expected<KangAction, ParseError>;
    };

    template <>
    struct GameCodec<HoldemGame>
    {
        static constexpr fb::GameState StateTag = fb::GameState::HoldemState;
        static constexpr fb::GameAction ActionTag = fb::GameAction::HoldemIntent;

        static auto PackState(flatbuffers::FlatBufferBuilder& fbb, HoldemState const& s) -> flatbuffers::Offset<void>;
        static auto UnpackState(fb::SnapshotMsg const& msg) -> std::expected<HoldemState, ParseError>;
        static auto PackAction(flatbuffers::FlatBufferBuilder& fbb, HoldemAction const& a) -> flatbuffers::Offset<void>;
        static auto UnpackAction(fb::ActionMsg const& msg) -> std::expected<HoldemAction, ParseError>;
    };

    template <>
    struct GameCodec<BlackjackGame>
    {
        static constexpr fb::GameState StateTag = fb::GameState::BlackjackState;
        static constexpr fb::GameAction ActionTag = fb::GameAction::BlackjackIntent;

        static auto PackState(flatbuffers::FlatBufferBuilder& fbb, BlackjackState const& s) -> flatbuffers::Offset<void>;
        static auto UnpackState(fb::SnapshotMsg const& msg) -> std::expected<BlackjackState, ParseError>;
        static auto PackAction(flatbuffers::FlatBufferBuilder& fbb, BlackjackAction const& a) -> flatbuffers::Offset<void>;
        static auto UnpackAction(fb::ActionMsg const& msg) -> std::expected<BlackjackAction, ParseError>;
    };

    template <>
    struct GameCodec<SlaveGame>
    {
        static constexpr fb::GameState StateTag = fb::GameState::SlaveState;
        static constexpr fb::GameAction ActionTag = fb::GameAction::SlaveIntent;

        static auto PackState(flatbuffers::FlatBufferBuilder& fbb, SlaveState const& s) -> flatbuffers::Offset<void>;
        static auto UnpackState(fb::SnapshotMsg const& msg) -> std::expected<SlaveState, ParseError>;
        static auto PackAction(flatbuffers::FlatBufferBuilder& fbb, SlaveAction const& a) -> flatbuffers::Offset<void>;
        static auto UnpackAction(fb::ActionMsg const& msg) -> std::expected<SlaveAction, ParseError>;
    };

    template <>
    struct GameCodec<DummyGame>
    {
        static constexpr fb::GameState StateTag = fb::GameState::DummyState;
        static constexpr fb::GameAction ActionTag = fb::GameAction::DummyIntent;

        static auto PackState(flatbuffers::FlatBufferBuilder& fbb, DummyState const& s) -> flatbuffers::Offset<void>;
        static auto UnpackState(fb::SnapshotMsg const& msg) -> std::expected<DummyState, ParseError>;
        static auto PackAction(flatbuffers::FlatBufferBuilder& fbb, DummyAction const& a) -> flatbuffers::Offset<void>;
        static auto UnpackAction(fb::ActionMsg const& msg) -> std::expected<DummyAction, ParseError>;
    };

    // ---------- Snapshot (host -> peers) ----------

    template <typename Game>
    auto BuildSnapshot(std::string_view session_id,
                       typename Game::Snapshot const& snap,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const state = GameCodec<Game>::PackState(fbb, snap.state);
        auto const deck = PackDeck(fbb, snap.deck);
        auto const sid = fbb.CreateString(session_id.data(), session_id.size());
        auto const sm = fb::CreateSnapshotMsg(fbb, msg_id, sid, ToFbKind(Game::Kind),
                                              GameCodec<Game>::StateTag, state, deck);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::SnapshotMsg, sm.Union());
        fb::FinishEnvelopeBuffer(fbb, env);
        return fbb.Release();
    }

    template <typename Game>
    auto DecodeSnapshot(fb::SnapshotMsg const& msg) -> std::expected<SnapshotFrame<Game>, ParseError>
    {
        if (msg.game() != ToFbKind(Game::Kind))
            return std::unexpected(ParseError{"snapshot is for another game"});
        if (msg.state_type() != GameCodec<Game>::StateTag)
            return std::unexpected(ParseError{"snapshot state does not match its game"});

        std::expected<typename Game::State, ParseError> state = GameCodec<Game>::UnpackState(msg);
        if (!state) return std::unexpected(state.error());
        std::expected<DeckSnapshot, ParseError> deck = UnpackDeck(msg.deck());
        if (!deck) return std::unexpected(deck.error());

        SnapshotFrame<Game> out{};
        out.msg_id = msg.msg_id();
        out.session_id = Str(msg.session_id());
        out.snapshot.state = std::move(*state);
        out.snapshot.deck = std::move(*deck);
        return out;
    }

    template <typename Game>
    auto DecodeSnapshot(std::span<std::byte const> bytes) -> std::expected<SnapshotFrame<Game>, ParseError>
    {
        std::expected<fb::Envelope const*, ParseError> env = OpenEnvelope(bytes);
        if (!env) return std::unexpected(env.error());
        fb::SnapshotMsg const* sm = (*env)->message_as_SnapshotMsg();
        if (!sm) return std::unexpected(ParseError{"not a SnapshotMsg"});
        return DecodeSnapshot<Game>(*sm);
    }

    // ---------- Action (peer -> host) ----------

    template <typename Game>
    auto BuildAction(std::string_view session_id,
                     PlayerId const& actor,
                     typename Game::Action const& action,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const intent = GameCodec<Game>::PackAction(fbb, action);
        auto const sid = fbb.CreateString(session_id.data(), session_id.size());
        auto const who = fbb.CreateString(actor);
        auto const am = fb::CreateActionMsg(fbb, msg_id, sid, who, ToFbKind(Game::Kind),
                                            GameCodec<Game>::ActionTag, intent);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::ActionMsg, am.Union());
        fb::FinishEnvelopeBuffer(fbb, env);
        return fbb.Release();
    }

    template <typename Game>
    auto DecodeAction(fb::ActionMsg const& msg) -> std::expected<ActionFrame<Game>, ParseError>
    {
        if (msg.game() != ToFbKind(Game::Kind))
            return std::unexpected(ParseError{"action is for another game"});
        if (msg.intent_type() != GameCodec<Game>::ActionTag)
            return std::unexpected(ParseError{"action intent does not match its game"});
        if (!msg.actor() || msg.actor()->size() == 0)
            return std::unexpected(ParseError{"action without actor"});

        std::expected<typename Game::Action, ParseError> action = GameCodec<Game>::UnpackAction(msg);
        if (!action) return std::unexpected(action.error());

        ActionFrame<Game> out{};
        out.msg_id = msg.msg_id();
        out.session_id = Str(msg.session_id());
        out.actor = msg.actor()->str();
        out.action = std::move(*action);
        return out;
    }

    template <typename Game>
    auto DecodeAction(std::span<std::byte const> bytes) -> std::expected<ActionFrame<Game>, ParseError>
    {
        std::expected<fb::Envelope const*, ParseError> env = OpenEnvelope(bytes);
        if (!env) return std::unexpected(env.error());
        fb::ActionMsg const* am = (*env)->message_as_ActionMsg();
        if (!am) return std::unexpected(ParseError{"not an ActionMsg"});
        return DecodeAction<Game>(*am);
    }
} // namespace cardroom::core::net

#endif //CARDROOM_CODEC_HPP
