#pragma once

#include "folio/domain/quote_tick.hpp"
#include "folio/events/event_types.hpp"
#include "folio/events/position_events.hpp"

#include <cstddef>
#include <type_traits>
#include <variant>

namespace folio {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Responsibility: The one envelope every message on the accounting loop
// travels in. Subscribers pick out their alternative with std::get_if (see
// EventBus::subscribe<T>) or std::visit.
//
// Adding an alternative means updating the visit sites in the codec and the
// Portfolio; the compiler points at each of them.
// -----------------------------------------------------------------------------
using Event = std::variant<
    domain::QuoteTick,
    AccountStateEvent,
    OrderFilledEvent,
    PositionOpenedEvent,
    PositionModifiedEvent,
    PositionClosedEvent,
    AccountingFaultEvent>;

// The subset of Event that Portfolio::updatePosition accepts.
using PositionEvent = std::variant<
    PositionOpenedEvent,
    PositionModifiedEvent,
    PositionClosedEvent>;

namespace detail {

template <typename T, typename... Alternatives>
constexpr std::size_t alternativeIndex(const std::variant<Alternatives...>*) {
  constexpr bool matches[] = {std::is_same_v<T, Alternatives>...};
  for (std::size_t i = 0; i < sizeof...(Alternatives); ++i) {
    if (matches[i]) {
      return i;
    }
  }
  return std::variant_npos;
}

}  // namespace detail

// Number of Event alternatives.
inline constexpr std::size_t kEventKindCount = std::variant_size_v<Event>;

// Index of T within Event, i.e. the value Event::index() returns when the
// variant holds a T.
template <typename T>
constexpr std::size_t eventKind() {
  constexpr std::size_t kind =
      detail::alternativeIndex<T>(static_cast<const Event*>(nullptr));
  static_assert(kind != std::variant_npos, "T is not an Event alternative");
  return kind;
}

}  // namespace folio
