#include <cverify/Verifier.h>
#include <iostream>

int main(int argc, char** argv) {
    return cverify::runVerifier(argc, argv, std::cout, std::cerr);
}
