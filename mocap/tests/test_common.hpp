#pragma once

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

// Test helper macros
#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::cerr << "  FAILED: " << #a << " != " << #b << std::endl; \
        std::cerr << "    Got: '" << (a) << "' vs '" << (b) << "'" << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::cerr << "  FAILED: " << #cond << " is false" << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_FALSE(cond) do { \
    if (cond) { \
        std::cerr << "  FAILED: " << #cond << " is true" << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_NEAR(a, b, tol) do { \
    if (!(std::abs((a) - (b)) <= (tol))) { \
        std::cerr << "  FAILED: " << #a << " not within " << (tol) << " of " << #b << std::endl; \
        std::cerr << "    Got: " << (a) << " vs " << (b) << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_THROWS(expr, exception_type) do { \
    bool caught = false; \
    try { expr; } catch (const exception_type&) { caught = true; } \
    if (!caught) { \
        std::cerr << "  FAILED: " << #expr << " did not throw " << #exception_type << std::endl; \
        std::exit(1); \
    } \
} while(0)

// Three-joint chain, 12 channels, three frames.
// Frame 1 moves the root to x=1 and turns Spine 90 degrees about Z.
static const char* kChainBvh =
    "HIERARCHY\n"
    "ROOT Hips\n"
    "{\n"
    "    OFFSET 0.00 0.00 0.00\n"
    "    CHANNELS 6 Xposition Yposition Zposition Zrotation Xrotation Yrotation\n"
    "    JOINT Spine\n"
    "    {\n"
    "        OFFSET 0.00 10.00 0.00\n"
    "        CHANNELS 3 Zrotation Xrotation Yrotation\n"
    "        JOINT Head\n"
    "        {\n"
    "            OFFSET 0.00 10.00 0.00\n"
    "            CHANNELS 3 Zrotation Xrotation Yrotation\n"
    "            End Site\n"
    "            {\n"
    "                OFFSET 0.00 5.00 0.00\n"
    "            }\n"
    "        }\n"
    "    }\n"
    "}\n"
    "MOTION\n"
    "Frames: 3\n"
    "Frame Time: 0.033333\n"
    "0 0 0 0 0 0 0 0 0 0 0 0\n"
    "1 0 0 0 0 0 90 0 0 0 0 0\n"
    "2 0 0 0 0 0 0 0 0 0 0 0\n";

// Scratch file path under the system temp directory
inline std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("mocap_test_" + name)).string();
}
