#include <iostream>
#include <string>
#include <stdexcept>
#include "FrequencySketch.hpp"
#include "TinyLfuAdmittor.hpp"

int main() {
    try {
        FrequencySketchOptions opt;
        opt.seed = 42;
        FrequencySketch<std::string> sketch(opt);

        // Not sized yet: every estimate is 0 and increments are dropped
        sketch.increment("A");
        std::cout << "initialized=" << sketch.is_initialized()
                  << " frequency(A)=" << sketch.frequency("A") << "\n";

        sketch.ensure_capacity(64);
        std::cout << "table_length=" << sketch.table_length()
                  << " sample_size=" << sketch.sample_size() << "\n";

        for (int i = 0; i < 16; ++i) sketch.increment("A");
        for (int i = 0; i < 3; ++i) sketch.increment("B");
        std::cout << "frequency(A)=" << sketch.frequency("A")
                  << " frequency(B)=" << sketch.frequency("B")
                  << " frequency(C)=" << sketch.frequency("C") << "\n";

        // Growing forgets everything recorded so far
        sketch.ensure_capacity(1024);
        std::cout << "after grow: table_length=" << sketch.table_length()
                  << " frequency(A)=" << sketch.frequency("A") << "\n";

        // Admission between a hot candidate and a cold victim
        TinyLfuAdmittor<int> admittor(1000, opt);
        for (int i = 0; i < 5; ++i) admittor.record(7);
        admittor.record(99);
        std::cout << "admit(7 over 99)=" << admittor.admit(7, 99)
                  << " admit(99 over 7)=" << admittor.admit(99, 7) << "\n";

        sketch.ensure_capacity(-1);
    } catch (const std::invalid_argument& e) {
        std::cout << "ensure_capacity(-1) rejected: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
