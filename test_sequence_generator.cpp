#include "src/sequence_generator.hpp"
#include "src/captcha_errors.hpp"
#include <iostream>
#include <set>
#include <string>

static int failures = 0;

static void check(bool condition, const std::string& name) {
    if (condition) {
        std::cout << "  ✅ " << name << std::endl;
    } else {
        std::cout << "  ❌ FAILED: " << name << std::endl;
        failures++;
    }
}

template <typename Fn>
static bool throwsInvalidArgument(Fn fn) {
    try {
        fn();
    } catch (const InvalidArgument&) {
        return true;
    }
    return false;
}

int main() {
    std::cout << "=== Testing Arrow Sequence Generation ===\n";

    SequenceGenerator generator;
    std::set<int> seen_symbols;
    bool all_valid = true;

    for (int i = 0; i < 200; ++i) {
        ArrowSequence sequence = generator.generateSequence();
        if (sequence.size() != 6) {
            all_valid = false;
        }
        for (const auto& dir : sequence) {
            int code = static_cast<int>(dir);
            if (!isValidSymbol(code)) {
                all_valid = false;
            }
            seen_symbols.insert(code);
        }
    }
    check(all_valid, "every sequence has 6 symbols from {0,1,2}");
    check(seen_symbols.size() == 3, "all three directions show up across draws");

    SequenceGenerator first(1234);
    SequenceGenerator second(1234);
    check(first.generateSequence() == second.generateSequence(), "same seed gives the same sequence");

    std::mt19937 engine_a(99);
    std::mt19937 engine_b(99);
    check(SequenceGenerator::generateSequence(engine_a) == SequenceGenerator::generateSequence(engine_b),
          "injected engines are honoured");

    std::cout << "\n=== Testing Conversions ===\n";

    ArrowSequence parsed = sequenceFromString("021102");
    check(parsed.size() == 6 && parsed[0] == ArrowDirection::LEFT && parsed[1] == ArrowDirection::RIGHT &&
          parsed[2] == ArrowDirection::UP, "digit string parses to directions");
    check(sequenceToString(parsed) == "021102", "directions print back as digits");

    check(throwsInvalidArgument([] { sequenceFromString("02110"); }), "short sequence rejected");
    check(throwsInvalidArgument([] { sequenceFromString("0211023"); }), "long sequence rejected");
    check(throwsInvalidArgument([] { sequenceFromString("021132"); }), "digit 3 rejected");
    check(throwsInvalidArgument([] { sequenceFromString("02a102"); }), "non digit rejected");

    check(directionToString(ArrowDirection::LEFT) == "left", "left name");
    check(directionToString(ArrowDirection::UP) == "up", "up name");
    check(directionToString(ArrowDirection::RIGHT) == "right", "right name");
    check(stringToDirection("up") == ArrowDirection::UP, "up parses");
    check(throwsInvalidArgument([] { stringToDirection("down"); }), "down is not part of the alphabet");

    check(isValidSymbol(0) && isValidSymbol(1) && isValidSymbol(2), "0..2 are valid symbols");
    check(!isValidSymbol(-1) && !isValidSymbol(3), "-1 and 3 are invalid symbols");

    std::cout << "\n=== Test completed: " << failures << " failure(s) ===\n";
    return failures == 0 ? 0 : 1;
}
