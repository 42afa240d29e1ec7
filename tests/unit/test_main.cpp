#include <gtest/gtest.h>
#include <FootMeasureAPI.h>

#include <opencv2/core.hpp>

#include <iostream>

int main(int argc, char** argv) {
    // Print library info
    std::cout << "========================================\n";
    std::cout << "FootMeasure Unit Tests\n";
    std::cout << "Version: " << foot_measure_get_version() << "\n";
    std::cout << "OpenCV: " << CV_VERSION << "\n";
    std::cout << "========================================\n\n";

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
