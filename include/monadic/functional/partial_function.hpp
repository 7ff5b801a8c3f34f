#pragma once
#include "monadic/core/constants.hpp"
#include "monadic/core/nullability.hpp"
#include "monadic/functional/fwd.hpp"
#include "monadic/functional/optional.hpp"
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
namespace monadic {
namespace detail {
template<typename P>
struct PairParts {
    using First = void;
    using Second = void;
};
template<typename K, typename V>
struct PairParts<std::pair<K, V>> {
    using First = K;
    using Second = V;
};
}

/**
 * @brief A function defined only on the inputs accepted by its verifier.
 *
 * The domain is { t : verifier(t) }. Apply() runs the mapper
 * unconditionally, so calling it outside the domain is the caller's
 * problem; use IsDefinedAt(), ApplyOrElse() or Lift() to stay inside it.
 *
 * Composition never mutates the operands: AndThen/Compose/OrElse copy the
 * verifier and mapper of both sides into a new PartialFunction.
 *
 * @code
 * auto half = PartialFunction<int, int>::Of(
 *     [](const int& v) { return v % 2 == 0; },
 *     [](const int& v) { return v / 2; });
 * auto lifted = half.Lift();
 * lifted(4);   // Optional(2)
 * lifted(3);   // Optional::Empty()
 * @endcode
 */
template<typename T, typename R>
class PartialFunction {
public:
    using Verifier = std::function<bool(const T&)>;
    using Mapper = std::function<R(const T&)>;
    using argument_type = T;
    using result_type = R;

    /// An empty verifier means "always defined". An empty mapper throws ArgumentError.
    [[nodiscard]] static PartialFunction Of(Verifier verifier, Mapper mapper) {
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        if (IsNull(verifier)) {
            verifier = AlwaysTrue();
        }
        return PartialFunction(std::move(verifier), std::move(mapper));
    }

    [[nodiscard]] static PartialFunction Identity() {
        static_assert(std::is_same_v<T, R>, "Identity requires matching argument and result types");
        return PartialFunction(AlwaysTrue(), [](const T& t) -> R { return t; });
    }

    /// Builds a PartialFunction whose result is the pair (key_mapper(t), value_mapper(t)).
    [[nodiscard]] static PartialFunction OfToTuple(
        Verifier verifier,
        std::function<typename detail::PairParts<R>::First(const T&)> key_mapper,
        std::function<typename detail::PairParts<R>::Second(const T&)> value_mapper) {
        static_assert(!std::is_void_v<typename detail::PairParts<R>::First>,
                      "OfToTuple requires a std::pair result type");
        AssertNotNull(key_mapper, ErrorMessages::KEY_MAPPER_NOT_NULL);
        AssertNotNull(value_mapper, ErrorMessages::VALUE_MAPPER_NOT_NULL);
        if (IsNull(verifier)) {
            verifier = AlwaysTrue();
        }
        return PartialFunction(
            std::move(verifier),
            [key_mapper = std::move(key_mapper), value_mapper = std::move(value_mapper)](const T& t) -> R {
                return R(key_mapper(t), value_mapper(t));
            });
    }

    [[nodiscard]] bool IsDefinedAt(const T& t) const {
        return verifier_(t);
    }

    /// Not guaranteed to fail outside the domain.
    [[nodiscard]] R Apply(const T& t) const {
        return mapper_(t);
    }

    R operator()(const T& t) const {
        return mapper_(t);
    }

    /// default_function is only required, and only checked, when t is outside the domain.
    template<typename F>
    [[nodiscard]] R ApplyOrElse(const T& t, F&& default_function) const {
        if (IsDefinedAt(t)) {
            return Apply(t);
        }
        AssertNotNull(default_function, ErrorMessages::DEFAULT_FUNCTION_NOT_NULL);
        return std::invoke(std::forward<F>(default_function), t);
    }

    /// Domain: this->IsDefinedAt(t) && after.IsDefinedAt(this->Apply(t)).
    template<typename V>
    [[nodiscard]] PartialFunction<T, V> AndThen(const PartialFunction<R, V>& after) const {
        auto verifier = verifier_;
        auto mapper = mapper_;
        return PartialFunction<T, V>(
            [verifier, mapper, after](const T& t) {
                return verifier(t) && after.IsDefinedAt(mapper(t));
            },
            [mapper, after](const T& t) -> V {
                return after.Apply(mapper(t));
            });
    }

    /// Domain unchanged, mapper becomes after(mapper(t)).
    template<typename F, typename = std::enable_if_t<!IsPartialFunctionV<F>>>
    [[nodiscard]] auto AndThen(F&& after) const
        -> PartialFunction<T, std::decay_t<std::invoke_result_t<F, const R&>>> {
        using V = std::decay_t<std::invoke_result_t<F, const R&>>;
        AssertNotNull(after, ErrorMessages::AFTER_NOT_NULL);
        auto mapper = mapper_;
        return PartialFunction<T, V>(
            verifier_,
            [mapper, after = std::decay_t<F>(std::forward<F>(after))](const T& t) -> V {
                return std::invoke(after, mapper(t));
            });
    }

    /// Domain: before.IsDefinedAt(v) && this->IsDefinedAt(before.Apply(v)).
    template<typename V>
    [[nodiscard]] PartialFunction<V, R> Compose(const PartialFunction<V, T>& before) const {
        auto verifier = verifier_;
        auto mapper = mapper_;
        return PartialFunction<V, R>(
            [verifier, before](const V& v) {
                return before.IsDefinedAt(v) && verifier(before.Apply(v));
            },
            [mapper, before](const V& v) -> R {
                return mapper(before.Apply(v));
            });
    }

    /// Domain: this->IsDefinedAt(before(v)). V must be given explicitly.
    template<typename V, typename F, typename = std::enable_if_t<!IsPartialFunctionV<F>>>
    [[nodiscard]] PartialFunction<V, R> Compose(F&& before) const {
        static_assert(std::is_convertible_v<std::invoke_result_t<F, const V&>, T>,
                      "Compose function must produce the argument type");
        AssertNotNull(before, ErrorMessages::BEFORE_NOT_NULL);
        auto verifier = verifier_;
        auto mapper = mapper_;
        auto function = std::decay_t<F>(std::forward<F>(before));
        return PartialFunction<V, R>(
            [verifier, function](const V& v) {
                return verifier(std::invoke(function, v));
            },
            [mapper, function](const V& v) -> R {
                return mapper(std::invoke(function, v));
            });
    }

    /// Left-biased union of both domains.
    [[nodiscard]] PartialFunction OrElse(const PartialFunction& default_partial_function) const {
        auto verifier = verifier_;
        auto mapper = mapper_;
        auto fallback = default_partial_function;
        return PartialFunction(
            [verifier, fallback](const T& t) {
                return verifier(t) || fallback.IsDefinedAt(t);
            },
            [verifier, mapper, fallback](const T& t) -> R {
                return verifier(t) ? mapper(t) : fallback.Apply(t);
            });
    }

    [[nodiscard]] PartialFunction OrElse(const std::optional<PartialFunction>& default_partial_function) const {
        if (!default_partial_function.has_value()) {
            return *this;
        }
        return OrElse(*default_partial_function);
    }

    /// Total function: present iff IsDefinedAt.
    [[nodiscard]] std::function<Optional<R>(const T&)> Lift() const {
        auto self = *this;
        return [self](const T& t) {
            return self.IsDefinedAt(t)
                ? Optional<R>::OfNullable(self.Apply(t))
                : Optional<R>::Empty();
        };
    }

    [[nodiscard]] const Verifier& GetVerifier() const noexcept { return verifier_; }
    [[nodiscard]] const Mapper& GetMapper() const noexcept { return mapper_; }

private:
    template<typename, typename>
    friend class PartialFunction;

    PartialFunction(Verifier verifier, Mapper mapper)
        : verifier_(std::move(verifier))
        , mapper_(std::move(mapper)) {}

    static Verifier AlwaysTrue() {
        return [](const T&) { return true; };
    }

    Verifier verifier_;
    Mapper mapper_;
};

}
