/*
 * Unit tests for qubit name resolution
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <qwire/errors.hpp>
#include <qwire/qasm/naming.hpp>

using namespace qwire::qasm;

TEST_SUITE("Qubit Naming") {
    TEST_CASE("resolve_qubit - default register") {
        CHECK(resolve_qubit(0, std::nullopt) == "q[0]");
        CHECK(resolve_qubit(12, std::nullopt) == "q[12]");
        CHECK(resolve_qubit(3, std::nullopt, "qr") == "qr[3]");
    }

    TEST_CASE("resolve_qubit - custom map") {
        QubitNameMap names{{0, "a"}, {1, "anc[0]"}};
        CHECK(resolve_qubit(0, names) == "a");
        CHECK(resolve_qubit(1, names) == "anc[0]");
        // the register name is ignored once a map is given
        CHECK(resolve_qubit(0, names, "qr") == "a");
    }

    TEST_CASE("resolve_qubit - index missing from map") {
        QubitNameMap names{{0, "a"}};
        CHECK_THROWS_AS(resolve_qubit(5, names), qwire::NameResolutionError);
        try {
            resolve_qubit(5, names);
        } catch (const qwire::NameResolutionError& e) {
            CHECK(e.qubit() == 5);
            CHECK(std::string(e.what()).find("5") != std::string::npos);
        }
    }

    TEST_CASE("resolve_qubit - empty map resolves nothing") {
        CHECK_THROWS_AS(resolve_qubit(0, QubitNameMap{}), qwire::NameResolutionError);
    }
}
