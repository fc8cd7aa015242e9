// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * Mutation Tests
 *
 * Tests for mutation operations, strategies and the mutator
 */

#include <boost/test/unit_test.hpp>

#include <fuzzer/errors.h>
#include <fuzzer/mutation_ops.h>
#include <fuzzer/mutation_strategy.h>
#include <fuzzer/mutator.h>
#include <util/random.h>

#include <set>
#include <string>

static bool IsPrintable(char c) {
    return PrintableChars().find(c) != std::string::npos;
}

BOOST_AUTO_TEST_SUITE(mutation_tests)

BOOST_AUTO_TEST_CASE(printable_charset) {
    const std::string& chars = PrintableChars();
    BOOST_CHECK_EQUAL(chars.size(), 100U);

    std::set<char> unique(chars.begin(), chars.end());
    BOOST_CHECK_EQUAL(unique.size(), 100U);

    BOOST_CHECK(IsPrintable('a'));
    BOOST_CHECK(IsPrintable('~'));
    BOOST_CHECK(IsPrintable('\x0b'));
    BOOST_CHECK(!IsPrintable('\0'));
    BOOST_CHECK(!IsPrintable('\x7f'));
}

BOOST_AUTO_TEST_CASE(empty_input) {
    CInsecureRand rng(1);

    BOOST_CHECK_EQUAL(CRandomizeChar().Mutate("", rng), "");
    BOOST_CHECK_EQUAL(CDeleteChar().Mutate("", rng), "");
    BOOST_CHECK_EQUAL(CDuplicateChar().Mutate("", rng), "");

    std::string inserted = CInsertRandomChar().Mutate("", rng);
    BOOST_REQUIRE_EQUAL(inserted.size(), 1U);
    BOOST_CHECK(IsPrintable(inserted[0]));
}

BOOST_AUTO_TEST_CASE(randomize_char) {
    CInsecureRand rng(2);
    const std::string input = "hello world";

    for (int i = 0; i < 200; ++i) {
        std::string out = CRandomizeChar().Mutate(input, rng);
        BOOST_REQUIRE_EQUAL(out.size(), input.size());

        size_t diffs = 0;
        for (size_t j = 0; j < out.size(); ++j) {
            if (out[j] != input[j]) {
                ++diffs;
                BOOST_CHECK(IsPrintable(out[j]));
            }
        }
        BOOST_CHECK(diffs <= 1);
    }
}

BOOST_AUTO_TEST_CASE(delete_char) {
    CInsecureRand rng(3);
    const std::string input = "abcdef";

    for (int i = 0; i < 100; ++i) {
        std::string out = CDeleteChar().Mutate(input, rng);
        BOOST_REQUIRE_EQUAL(out.size(), input.size() - 1);

        // Removing one unit keeps the rest in order
        size_t j = 0;
        for (char c : input) {
            if (j < out.size() && out[j] == c) ++j;
        }
        BOOST_CHECK_EQUAL(j, out.size());
    }

    BOOST_CHECK_EQUAL(CDeleteChar().Mutate("x", rng), "");
}

BOOST_AUTO_TEST_CASE(insert_random_char) {
    CInsecureRand rng(4);
    const std::string input = "abc";
    bool inserted_at_end = false;
    bool inserted_at_start = false;

    for (int i = 0; i < 500; ++i) {
        std::string out = CInsertRandomChar().Mutate(input, rng);
        BOOST_REQUIRE_EQUAL(out.size(), input.size() + 1);
        if (out.compare(0, 3, input) == 0) inserted_at_end = true;
        if (out.compare(1, 3, input) == 0) inserted_at_start = true;
    }

    // Insertion point covers [0, len]
    BOOST_CHECK(inserted_at_start);
    BOOST_CHECK(inserted_at_end);
}

BOOST_AUTO_TEST_CASE(duplicate_char) {
    CInsecureRand rng(5);

    for (int i = 0; i < 100; ++i) {
        std::string out = CDuplicateChar().Mutate("abcd", rng);
        BOOST_CHECK(out == "aabcd" || out == "abbcd" || out == "abccd" || out == "abcdd");
    }

    BOOST_CHECK_EQUAL(CDuplicateChar().Mutate("z", rng), "zz");
}

BOOST_AUTO_TEST_CASE(operation_names) {
    std::set<std::string> names;
    for (const auto& op : AllMutationOperations()) {
        names.insert(op->GetName());
    }
    BOOST_CHECK_EQUAL(names.size(), 4U);
}

BOOST_AUTO_TEST_CASE(single_strategy_selects_one) {
    CInsecureRand rng(6);
    CRandomSingleStrategy strategy;
    std::set<const CMutationOperation*> seen;

    for (int i = 0; i < 400; ++i) {
        auto ops = strategy.Select(rng);
        BOOST_REQUIRE_EQUAL(ops.size(), 1U);
        seen.insert(ops[0].get());
    }
    BOOST_CHECK_EQUAL(seen.size(), 4U);
}

BOOST_AUTO_TEST_CASE(stacked_strategy_bounds) {
    CInsecureRand rng(7);
    CStackedStrategy strategy;
    std::set<size_t> counts;

    for (int i = 0; i < 500; ++i) {
        size_t n = strategy.Select(rng).size();
        BOOST_CHECK(n >= CStackedStrategy::DEFAULT_MIN_OPS);
        BOOST_CHECK(n <= CStackedStrategy::DEFAULT_MAX_OPS);
        counts.insert(n);
    }
    BOOST_CHECK_EQUAL(counts.size(), 4U);  // 2, 3, 4, 5

    CStackedStrategy fixed(AllMutationOperations(), 3, 3);
    BOOST_CHECK_EQUAL(fixed.Select(rng).size(), 3U);
}

BOOST_AUTO_TEST_CASE(strategy_configuration_errors) {
    BOOST_CHECK_THROW(CRandomSingleStrategy(std::vector<MutationOpRef>{}), ConfigurationError);
    BOOST_CHECK_THROW(CStackedStrategy(std::vector<MutationOpRef>{}), ConfigurationError);
    BOOST_CHECK_THROW(CStackedStrategy(AllMutationOperations(), 0, 3), ConfigurationError);
    BOOST_CHECK_THROW(CStackedStrategy(AllMutationOperations(), 4, 2), ConfigurationError);

    BOOST_CHECK_EQUAL(std::string(MakeMutationStrategy("single")->GetName()), "single");
    BOOST_CHECK_EQUAL(std::string(MakeMutationStrategy("stacked")->GetName()), "stacked");
    BOOST_CHECK_THROW(MakeMutationStrategy("havoc"), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(mutator_applies_in_order) {
    CInsecureRand rng(8);

    // Two deletes in sequence shorten by exactly two
    std::vector<MutationOpRef> deletes{std::make_shared<CDeleteChar>()};
    CMutator mutator(rng, std::make_unique<CStackedStrategy>(deletes, 2, 2));
    for (int i = 0; i < 50; ++i) {
        BOOST_CHECK_EQUAL(mutator.Mutate("abcdef").size(), 4U);
    }
    BOOST_CHECK_EQUAL(mutator.Mutate("ab"), "");
    BOOST_CHECK_EQUAL(mutator.Mutate("a"), "");
}

BOOST_AUTO_TEST_CASE(default_mutator_changes_length_by_at_most_one) {
    CInsecureRand rng(9);
    CMutator mutator(rng);
    BOOST_CHECK_EQUAL(std::string(mutator.GetStrategy().GetName()), "single");

    const std::string input = "seed input";
    for (int i = 0; i < 200; ++i) {
        std::string out = mutator.Mutate(input);
        BOOST_CHECK(out.size() + 1 >= input.size());
        BOOST_CHECK(out.size() <= input.size() + 1);
    }
}

BOOST_AUTO_TEST_CASE(seeded_rng_is_reproducible) {
    CInsecureRand a(42), b(42);
    CMutator ma(a, std::make_unique<CStackedStrategy>());
    CMutator mb(b, std::make_unique<CStackedStrategy>());

    for (int i = 0; i < 20; ++i) {
        BOOST_CHECK_EQUAL(ma.Mutate("reproducible"), mb.Mutate("reproducible"));
    }
}

BOOST_AUTO_TEST_SUITE_END()
