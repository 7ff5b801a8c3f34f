#pragma once
#include "monadic/core/constants.hpp"
#include "monadic/core/failures.hpp"
#include "monadic/core/nullability.hpp"
#include "monadic/functional/fwd.hpp"
#include "monadic/functional/optional.hpp"
#include <exception>
#include <functional>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
namespace monadic {

/// Right-biased sum of a Left (usually an error) and a Right value.
/// Like Try, the Right payload may be empty: Right() is legal, and
/// Right(value) with a null value is the same empty Right.
template<typename L, typename R>
class Either {
private:
    std::variant<L, std::optional<R>> value_;
public:
    using left_type = L;
    using value_type = R;

    [[nodiscard]] static Either Right(R value) {
        if (IsNull(value)) {
            return Right();
        }
        return Either(std::in_place_index<1>, std::optional<R>(std::move(value)));
    }
    [[nodiscard]] static Either Right() {
        return Either(std::in_place_index<1>, std::optional<R>());
    }
    [[nodiscard]] static Either Left(L value) {
        return Either(std::in_place_index<0>, std::move(value));
    }

    /// Left fold of Ap over eithers; an empty sequence gives an empty Right.
    template<typename FLeft, typename FRight>
    [[nodiscard]] static Either Combine(FLeft&& mapper_left, FRight&& mapper_right, std::span<const Either> eithers) {
        if (eithers.empty()) {
            return Right();
        }
        Either result = eithers.front();
        for (std::size_t i = 1; i < eithers.size(); ++i) {
            result = result.Ap(eithers[i], mapper_left, mapper_right);
        }
        return result;
    }

    [[nodiscard]] bool IsRight() const noexcept { return value_.index() == 1; }
    [[nodiscard]] bool IsLeft() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool HasValue() const noexcept {
        return IsRight() && std::get<1>(value_).has_value();
    }
    [[nodiscard]] bool IsEmpty() const noexcept {
        return !HasValue();
    }

    [[nodiscard]] const R& Get() const {
        if (IsLeft()) {
            throw StateError(std::string(ErrorMessages::LEFT_HAS_NO_RIGHT));
        }
        const auto& payload = std::get<1>(value_);
        if (!payload.has_value()) {
            throw StateError(std::string(ErrorMessages::EMPTY_RIGHT));
        }
        return *payload;
    }
    [[nodiscard]] const L& GetLeft() const {
        if (IsRight()) {
            throw StateError(std::string(ErrorMessages::RIGHT_HAS_NO_LEFT));
        }
        return std::get<0>(value_);
    }

    template<typename FLeft, typename FRight>
    [[nodiscard]] Either Ap(const Either& other, FLeft&& mapper_left, FRight&& mapper_right) const {
        if (IsRight()) {
            if (other.IsRight()) {
                if (!HasValue() || !other.HasValue()) {
                    return Right();
                }
                return Right(std::invoke(std::forward<FRight>(mapper_right), Get(), other.Get()));
            }
            return Left(other.GetLeft());
        }
        if (other.IsRight()) {
            return Left(GetLeft());
        }
        return Left(std::invoke(std::forward<FLeft>(mapper_left), GetLeft(), other.GetLeft()));
    }

    [[nodiscard]] bool Contains(const R& value) const {
        return HasValue() && detail::ValueEquals(Get(), value);
    }

    /// Right values failing predicate give std::nullopt; Left and a null predicate give *this.
    template<typename Pred>
    [[nodiscard]] std::optional<Either> Filter(Pred&& predicate) const {
        if (!HasValue() || IsNull(predicate)) {
            return *this;
        }
        if (std::invoke(std::forward<Pred>(predicate), Get())) {
            return *this;
        }
        return std::nullopt;
    }

    template<typename Pred>
    [[nodiscard]] Optional<Either> FilterOptional(Pred&& predicate) const {
        return Optional<Either>::OfNullable(Filter(std::forward<Pred>(predicate)));
    }

    template<typename Pred, typename FZero>
    [[nodiscard]] Either FilterOrElse(Pred&& predicate, FZero&& zero) const {
        if (!HasValue() || IsNull(predicate)) {
            return *this;
        }
        if (std::invoke(std::forward<Pred>(predicate), Get())) {
            return *this;
        }
        AssertNotNull(zero, ErrorMessages::SUPPLIER_NOT_NULL);
        return Left(std::invoke(std::forward<FZero>(zero)));
    }

    template<typename F>
    [[nodiscard]] auto FlatMap(F&& mapper) const -> std::decay_t<std::invoke_result_t<F, const R&>> {
        using ResultType = std::decay_t<std::invoke_result_t<F, const R&>>;
        static_assert(IsEither<ResultType>::value, "FlatMap function must return an Either");
        if (IsLeft()) {
            return ResultType::Left(GetLeft());
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return std::invoke(std::forward<F>(mapper), Get());
    }

    template<typename FLeft, typename FRight>
    auto Fold(FLeft&& mapper_left, FRight&& mapper_right) const -> std::invoke_result_t<FRight, const R&> {
        if (IsRight()) {
            AssertNotNull(mapper_right, ErrorMessages::MAPPER_NOT_NULL);
            return std::invoke(std::forward<FRight>(mapper_right), Get());
        }
        AssertNotNull(mapper_left, ErrorMessages::MAPPER_NOT_NULL);
        return std::invoke(std::forward<FLeft>(mapper_left), GetLeft());
    }

    [[nodiscard]] R GetOrElse(R other) const {
        return HasValue() ? Get() : other;
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& mapper) const -> Either<L, std::decay_t<std::invoke_result_t<F, const R&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const R&>>;
        if (IsLeft()) {
            return Either<L, U>::Left(GetLeft());
        }
        if (!HasValue()) {
            return Either<L, U>::Right();
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return Either<L, U>::Right(std::invoke(std::forward<F>(mapper), Get()));
    }

    template<typename F>
    [[nodiscard]] auto MapLeft(F&& mapper) const -> Either<std::decay_t<std::invoke_result_t<F, const L&>>, R> {
        using U = std::decay_t<std::invoke_result_t<F, const L&>>;
        if (IsRight()) {
            return HasValue() ? Either<U, R>::Right(Get()) : Either<U, R>::Right();
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return Either<U, R>::Left(std::invoke(std::forward<F>(mapper), GetLeft()));
    }

    [[nodiscard]] Either OrElse(const Either& other) const {
        return IsRight() ? *this : other;
    }

    /// An empty Right has nothing to swap into a Left and throws StateError.
    [[nodiscard]] Either<R, L> Swap() const {
        if (IsRight()) {
            return Either<R, L>::Left(Get());
        }
        return Either<R, L>::Right(GetLeft());
    }

    [[nodiscard]] Optional<R> ToOptional() const {
        return IsEmpty() ? Optional<R>::Empty() : Optional<R>::Of(Get());
    }

    template<typename F>
    [[nodiscard]] Try<R> ToTry(F&& mapper_left) const {
        if (IsRight()) {
            return HasValue() ? Try<R>::Success(Get()) : Try<R>::Success();
        }
        AssertNotNull(mapper_left, ErrorMessages::MAPPER_NOT_NULL);
        return Try<R>::Failure(std::invoke(std::forward<F>(mapper_left), GetLeft()));
    }

    [[nodiscard]] Validation<L, R> ToValidation() const {
        return Validation<L, R>::FromEither(*this);
    }

private:
    template<std::size_t I, typename... Args>
    explicit Either(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}
};

}

#include "monadic/functional/try.hpp"
#include "monadic/functional/validation.hpp"
