#include <iostream>

// Forward declarations from the *_test.cpp files
void run_namespace_registry_tests();
void run_type_debug_tests();
void run_class_completion_tests();
void run_scope_tracker_tests();
void run_function_prologue_tests();
void run_env_tests();

int main(){
    run_namespace_registry_tests();
    run_type_debug_tests();
    run_class_completion_tests();
    run_scope_tracker_tests();
    run_function_prologue_tests();
    run_env_tests();
    std::cout << "All tests passed\n";
    return 0;
}
