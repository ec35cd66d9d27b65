/*
 * Unit tests for the u3 Euler decomposition
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <complex>

#include <qwire/qasm/decomposition.hpp>

using namespace qwire::qasm;
using C = std::complex<double>;

static constexpr double kPi = 3.14159265358979323846;

TEST_SUITE("Single Qubit Decomposition") {
    TEST_CASE("identity column gives zero angles") {
        auto a = decompose_single_qubit(C(1.0, 0.0), C(0.0, 0.0));
        CHECK(a.theta == 0.0);
        CHECK(a.phi == 0.0);
        CHECK(a.lambda == 0.0);
        CHECK(std::signbit(a.lambda));
        CHECK_FALSE(std::signbit(a.phi));
    }

    TEST_CASE("bit flip column gives theta = pi") {
        auto a = decompose_single_qubit(C(0.0, 0.0), C(1.0, 0.0));
        CHECK(a.theta == doctest::Approx(kPi));
        CHECK(a.phi == doctest::Approx(0.0));
        CHECK(a.lambda == doctest::Approx(0.0));
    }

    TEST_CASE("phases of alpha and beta") {
        C alpha = std::polar(0.6, 0.3);
        C beta = std::polar(0.8, -1.1);
        auto a = decompose_single_qubit(alpha, beta);
        CHECK(a.theta == doctest::Approx(2.0 * std::acos(0.6)));
        CHECK(a.phi == doctest::Approx(-1.4));
        CHECK(a.lambda == doctest::Approx(0.8));
    }

    TEST_CASE("theta stays within [0, pi]") {
        for (int i = 0; i <= 16; ++i) {
            double t = kPi * i / 16.0;
            C alpha = std::polar(std::cos(t / 2.0), 0.7 * i);
            C beta = std::polar(std::sin(t / 2.0), -0.4 * i);
            auto a = decompose_single_qubit(alpha, beta);
            CAPTURE(i);
            CHECK(a.theta >= 0.0);
            CHECK(a.theta <= kPi + 1e-12);
            CHECK(a.theta == doctest::Approx(t));
        }
    }

    TEST_CASE("conjugating beta exchanges phi and lambda") {
        C alpha = std::polar(0.6, 0.3);
        C beta = std::polar(0.8, -1.1);
        auto a = decompose_single_qubit(alpha, beta);
        auto b = decompose_single_qubit(alpha, std::conj(beta));
        CHECK(b.theta == doctest::Approx(a.theta));
        CHECK(b.phi == doctest::Approx(a.lambda));
        CHECK(b.lambda == doctest::Approx(a.phi));
    }

    TEST_CASE("conjugating beta with real alpha negates both phase angles") {
        C alpha(0.6, 0.0);
        C beta = std::polar(0.8, 0.9);
        auto a = decompose_single_qubit(alpha, beta);
        auto b = decompose_single_qubit(alpha, std::conj(beta));
        CHECK(b.theta == doctest::Approx(a.theta));
        CHECK(b.phi == doctest::Approx(-a.phi));
        CHECK(b.lambda == doctest::Approx(-a.lambda));
    }

    TEST_CASE("magnitude overshoot is clamped") {
        auto a = decompose_single_qubit(C(std::nextafter(1.0, 2.0), 0.0), C(0.0, 0.0));
        CHECK_FALSE(std::isnan(a.theta));
        CHECK(a.theta == 0.0);
    }
}
