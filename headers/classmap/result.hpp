//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CLASSMAP_RESULT_HPP
#define CLASSMAP_RESULT_HPP

/**
 * @file result.hpp
 * @brief Result type used instead of exceptions on every scan path.
 *
 * Result<T, E> holds either a value of type T or an error of type E.
 *
 * @code
 *     Result<SymbolMap, Error> table = loader.generate_table(dir, options);
 *     if (table.is_ok()) {
 *         for (const auto& [id, path] : table.value()) { ... }
 *     }
 * @endcode
 */

#include <variant>
#include <optional>
#include <utility>
#include <stdexcept>

namespace classmap {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Either a success value or an error. Never empty.
     *
     * @tparam T Success type.
     * @tparam E Error type.
     */
    template<typename T, typename E>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(success_tag, std::move(value));
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        Result(SuccessTag, T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : data_(std::in_place_index<1>, std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        /**
         * @throws std::logic_error if the Result holds an error.
         */
        T& value() & {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        const T& value() const& {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        T&& value() && {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(std::move(data_));
        }

        /**
         * @throws std::logic_error if the Result holds a value.
         */
        E& error() & {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        T value_or(T default_value) const& {
            if (is_ok()) {
                return std::get<0>(data_);
            }
            return default_value;
        }

    private:
        std::variant<T, E> data_;
    };

    /**
     * Result for operations that only report success or failure.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() {
            return Result(success_tag);
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        explicit Result(SuccessTag) : error_(std::nullopt) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

    private:
        std::optional<E> error_;
    };

}  // namespace classmap

#endif //CLASSMAP_RESULT_HPP
