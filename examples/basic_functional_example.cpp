/**
 * @file basic_functional_example.cpp
 * @brief Basic example demonstrating Try, Validation, Optional and PartialFunction
 */

#include "monadic/functional/either.hpp"
#include "monadic/functional/optional.hpp"
#include "monadic/functional/partial_function.hpp"
#include "monadic/functional/try.hpp"
#include "monadic/functional/validation.hpp"
#include "monadic/functional/validation_error.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace monadic;

using PortCheck = Validation<ValidationError, int>;

void print_errors(const std::string& label, std::vector<ValidationError> errors) {
    std::sort(errors.begin(), errors.end());
    std::cout << label << ":" << std::endl;
    for (const auto& error : errors) {
        std::cout << "     [" << error.GetPriority() << "] " << error.GetErrorMessage() << std::endl;
    }
}

int main() {
    std::cout << "=== Monadic - Basic Functional Example ===" << std::endl;
    std::cout << std::endl;

    // Capture a throwing computation
    std::cout << "1. Parsing numbers with Try..." << std::endl;
    auto parsed = TryOf([](const std::string& text) { return std::stoi(text); }, std::string("8080"));
    auto broken = TryOf([](const std::string& text) { return std::stoi(text); }, std::string("http"));
    if (parsed.IsFailure()) {
        std::cerr << "Failed to parse: " << parsed.GetErrorMessage() << std::endl;
        return 1;
    }
    std::cout << "   ✓ Parsed " << parsed.Get() << std::endl;
    std::cout << "   ✗ Captured failure: " << broken.GetErrorMessage() << std::endl;
    std::cout << "   Fallback value: " << broken.GetOrElse(80) << std::endl;
    std::cout << std::endl;

    // Accumulate every validation error
    std::cout << "2. Validating a port with Validation::Combine..." << std::endl;
    auto in_range = [](int port) {
        return PortCheck::Valid(port).FilterOrElse(
            [](const int& p) { return p > 0 && p < 65536; },
            [](const int& p) { return ValidationError::Of(1, "port out of range: " + std::to_string(p)); });
    };
    auto unprivileged = [](int port) {
        return PortCheck::Valid(port).FilterOrElse(
            [](const int& p) { return p >= 1024; },
            [](const int& p) { return ValidationError::Of(0, "privileged port: " + std::to_string(p)); });
    };
    std::vector<PortCheck> good_checks{in_range(parsed.Get()), unprivileged(parsed.Get())};
    auto good = PortCheck::Combine(good_checks);
    std::cout << "   ✓ Port " << good.Get() << " is valid" << std::endl;

    std::vector<PortCheck> bad_checks{in_range(-1), unprivileged(-1)};
    auto bad = PortCheck::Combine(bad_checks);
    if (bad.IsInvalid()) {
        print_errors("   ✗ Port -1 is invalid", bad.GetErrors());
    }
    std::cout << std::endl;

    // Stop at the first failure
    std::cout << "3. Lazy validation with CombineGetFirstInvalid..." << std::endl;
    int evaluated = 0;
    std::vector<PortCheck::Supplier> suppliers{
        [&evaluated, &unprivileged] { ++evaluated; return unprivileged(22); },
        [&evaluated, &in_range] { ++evaluated; return in_range(22); },
    };
    auto first = PortCheck::CombineGetFirstInvalid(suppliers);
    print_errors("   ✗ First problem", first.GetErrors());
    std::cout << "   Suppliers evaluated: " << evaluated << " of " << suppliers.size() << std::endl;
    std::cout << std::endl;

    // Partial functions
    std::cout << "4. Classifying ports with PartialFunction..." << std::endl;
    auto well_known = PartialFunction<int, std::string>::Of(
        [](const int& port) { return port < 1024; },
        [](const int& port) { return "well-known (" + std::to_string(port) + ")"; });
    auto registered = PartialFunction<int, std::string>::Of(
        [](const int& port) { return port >= 1024 && port < 49152; },
        [](const int& port) { return "registered (" + std::to_string(port) + ")"; });
    auto classify = well_known.OrElse(registered).Lift();
    for (int port : {22, 8080, 50000}) {
        auto label = classify(port);
        std::cout << "   " << port << " -> " << label.GetOrElse("unclassified") << std::endl;
    }
    std::cout << std::endl;

    // Conversions
    std::cout << "5. Converting between containers..." << std::endl;
    auto either = parsed.ToEither();
    auto validation = Validation<std::exception_ptr, int>::FromTry(broken);
    auto maybe = Optional<int>::OfNullable(either.ToOptional().GetOrElse(0));
    std::cout << "   Either is right: " << std::boolalpha << either.IsRight() << std::endl;
    std::cout << "   Validation errors from failed Try: " << validation.GetErrors().size() << std::endl;
    std::cout << "   Optional value: " << maybe.Get() << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
