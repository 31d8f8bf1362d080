// include/tickspec/harness/Spec.hpp
//
// Everything a spec file needs: registration (TICKSPEC_SPEC), the replay
// controls (TICKSPEC_WAIT, ctx.Iteration()) and the failure primitives
// (TICKSPEC_REQUIRE, TICKSPEC_ASSERT_APPROX_EQ, TICKSPEC_FAIL).
#pragma once

#include "tickspec/harness/Assertions.hpp"
#include "tickspec/harness/TestContext.hpp"
#include "tickspec/harness/TestRegistry.hpp"
