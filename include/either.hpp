#ifndef CARTOPOSTER_EITHER_HPP
#define CARTOPOSTER_EITHER_HPP

#include <boost/variant.hpp>

namespace cartoposter {

/* Sum of a value and an error, modelled on Haskell's Either.
 *
 * The capability interfaces (geocoding, feature retrieval) return one
 * of these so that callers can decide which failures to retry without
 * having to unpick exceptions. Left is the value, right the error.
 *
 * L and R must be distinct types.
 */
template <typename L, typename R>
struct either {
   inline either(const either<L, R> &other) : m_impl(other.m_impl) {}
   inline either(either<L, R> &&other) : m_impl(std::move(other.m_impl)) {}
   inline explicit either(const L &left) : m_impl(left) {}
   inline explicit either(L &&left) : m_impl(std::move(left)) {}
   inline explicit either(const R &right) : m_impl(right) {}
   inline explicit either(R &&right) : m_impl(std::move(right)) {}

   inline either<L, R> &operator=(const either<L, R> &other) { m_impl = other.m_impl; return *this; }
   inline either<L, R> &operator=(either<L, R> &&other) { m_impl = std::move(other.m_impl); return *this; }

   inline bool is_left() const { return boost::get<L>(&m_impl) != nullptr; }
   inline bool is_right() const { return !is_left(); }

   inline const L &left() const { return *boost::get<L>(&m_impl); }
   inline const R &right() const { return *boost::get<R>(&m_impl); }

   // moves the value out, leaving a moved-from value behind.
   inline L take_left() { return std::move(*boost::get<L>(&m_impl)); }

private:
   boost::variant<L, R> m_impl;
};

} // namespace cartoposter

#endif /* CARTOPOSTER_EITHER_HPP */
