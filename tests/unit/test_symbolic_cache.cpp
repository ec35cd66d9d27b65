/*
 * Unit tests for the symbolic placeholder cache
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <set>
#include <thread>

#include <qwire/errors.hpp>
#include <qwire/qasm/symbolic_cache.hpp>

using namespace qwire::qasm;

TEST_SUITE("Symbolic Cache") {
    TEST_CASE("FNV-1a reference values") {
        CHECK(SymbolicCache::hash("") == 0xcbf29ce484222325ULL);
        CHECK(SymbolicCache::hash("a") == 0xaf63dc4c8601ec8cULL);
        CHECK(SymbolicCache::token_for(0xcbf29ce484222325ULL) == "sym_cbf29ce484222325");
        CHECK(SymbolicCache::token_for(1) == "sym_0000000000000001");
    }

    TEST_CASE("staging is idempotent") {
        SymbolicCache cache;
        auto first = cache.stage("theta");
        auto second = cache.stage("theta");
        CHECK(first == second);
        CHECK(cache.size() == 1);
        CHECK(cache.resolve(first) == "theta");
    }

    TEST_CASE("distinct expressions get distinct tokens") {
        SymbolicCache cache;
        auto a = cache.stage("theta");
        auto b = cache.stage("theta/2");
        CHECK(a != b);
        CHECK(cache.size() == 2);
        auto entries = cache.entries();
        CHECK(entries.at(a) == "theta");
        CHECK(entries.at(b) == "theta/2");

        cache.clear();
        CHECK(cache.size() == 0);
        CHECK_THROWS_AS(cache.resolve(a), qwire::ParameterError);
    }

    TEST_CASE("unknown token") {
        SymbolicCache cache;
        CHECK_THROWS_AS(cache.resolve("sym_0000000000000000"), qwire::ParameterError);
    }

    TEST_CASE("bind substitutes every placeholder") {
        SymbolicCache cache;
        auto t = cache.stage("theta");
        auto h = cache.stage("theta/2");
        std::vector<std::string> lines{"rx(" + t + ") q[0];", "h q[1];", "rz(" + h + ") q[0];", "ry(" + t + ") q[2];"};

        qwire::calculator::Calculator calc;
        calc.set("theta", 1.0);
        auto bound = cache.bind(lines, calc);
        std::vector<std::string> expected{"rx(1.0) q[0];", "h q[1];", "rz(0.5) q[0];", "ry(1.0) q[2];"};
        CHECK(bound == expected);

        calc.set("theta", 3.0);
        CHECK(cache.bind(lines, calc)[2] == "rz(1.5) q[0];");

        qwire::calculator::Calculator empty;
        CHECK_THROWS_AS(cache.bind(lines, empty), qwire::ParameterError);
    }

    TEST_CASE("concurrent staging keeps one entry per expression") {
        SymbolicCache cache;
        constexpr int kThreads = 8;
        constexpr int kExpressions = 100;
        std::vector<std::set<std::string>> seen(kThreads);
        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&cache, &seen, t] {
                for (int i = 0; i < kExpressions; ++i) {
                    seen[t].insert(cache.stage("theta_" + std::to_string(i)));
                }
            });
        }
        for (auto& w : workers) w.join();

        CHECK(cache.size() == kExpressions);
        for (int t = 1; t < kThreads; ++t) CHECK(seen[t] == seen[0]);
    }
}
