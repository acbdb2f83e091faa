#include "risk/PositionSizer.h"
#include "common/Errors.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace tradesense;
using risk::PositionSizer;
using risk::SizingRequest;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

SizingRequest request(double balance, double entry, double stop) {
    SizingRequest r;
    r.account_balance = balance;
    r.entry_price = entry;
    r.stop_distance = stop;
    return r;
}

void testFixedFractional() {
    // 2% of 10,000 at risk over a 5.0 stop = 40 units, 4,000 notional > 10% cap
    auto result = PositionSizer::calculate(request(10000.0, 100.0, 5.0));
    assert(near(result.risk_amount, 200.0));
    assert(near(result.position_size, 10.0));
    assert(result.capped_by_exposure);
    assert(near(result.percentage_of_account, 10.0));

    // Wide stop: risk-bound size stays under the cap
    result = PositionSizer::calculate(request(10000.0, 100.0, 50.0));
    assert(near(result.position_size, 4.0));
    assert(!result.capped_by_exposure);
    assert(near(result.position_value, 400.0));

    // Regime multiplier applies after the risk calculation
    result = PositionSizer::calculate(request(10000.0, 100.0, 50.0), 0.6);
    assert(near(result.position_size, 2.4));

    SizingRequest custom = request(10000.0, 100.0, 50.0);
    custom.risk_per_trade = 0.01;
    custom.max_account_exposure = 0.05;
    result = PositionSizer::calculate(custom);
    assert(near(result.position_size, 2.0));

    assert(near(PositionSizer::stopDistanceFromPct(200.0, 0.025), 5.0));

    std::cout << "[TEST] fixed fractional PASSED" << std::endl;
}

void testExposureBound() {
    const double balances[] = {1.0, 500.0, 10000.0, 2.5e6};
    const double entries[] = {0.001, 1.0, 100.0, 65000.0};
    const double stops[] = {1e-6, 0.01, 1.0, 250.0};
    const double multipliers[] = {0.6, 0.7, 0.8, 1.0, 1.2, 3.0};
    const double exposures[] = {0.05, 0.10, 0.20, 1.0};

    for (double balance : balances) {
        for (double entry : entries) {
            for (double stop : stops) {
                for (double multiplier : multipliers) {
                    for (double exposure : exposures) {
                        SizingRequest r = request(balance, entry, stop);
                        r.max_account_exposure = exposure;
                        auto result = PositionSizer::calculate(r, multiplier);
                        double cap = balance * exposure / entry;
                        assert(result.position_size > 0.0);
                        assert(result.position_size <= cap * (1.0 + 1e-12));
                    }
                }
            }
        }
    }

    std::cout << "[TEST] exposure bound PASSED" << std::endl;
}

bool throwsInvalid(const SizingRequest& r, double multiplier = 1.0) {
    try {
        PositionSizer::calculate(r, multiplier);
    } catch (const InvalidParameterError&) {
        return true;
    }
    return false;
}

void testContractViolations() {
    assert(throwsInvalid(request(10000.0, 100.0, 0.0)));
    assert(throwsInvalid(request(10000.0, 100.0, -1.0)));
    assert(throwsInvalid(request(0.0, 100.0, 1.0)));
    assert(throwsInvalid(request(-5.0, 100.0, 1.0)));
    assert(throwsInvalid(request(10000.0, 0.0, 1.0)));
    assert(throwsInvalid(request(10000.0, std::numeric_limits<double>::quiet_NaN(), 1.0)));
    assert(throwsInvalid(request(10000.0, 100.0, std::numeric_limits<double>::infinity())));
    assert(throwsInvalid(request(10000.0, 100.0, 1.0), 0.0));

    SizingRequest r = request(10000.0, 100.0, 1.0);
    r.risk_per_trade = 1.5;
    assert(throwsInvalid(r));

    try {
        PositionSizer::calculate(request(10000.0, 100.0, 0.0));
        assert(false);
    } catch (const InvalidParameterError& e) {
        assert(e.stage() == "PositionSizer.stop_distance");
    }

    std::cout << "[TEST] contract violations PASSED" << std::endl;
}

}

int main() {
    std::cout << "[TEST] Starting PositionSizer Test..." << std::endl;

    testFixedFractional();
    testExposureBound();
    testContractViolations();

    std::cout << "[TEST] PositionSizer Test PASSED!" << std::endl;
    return 0;
}
