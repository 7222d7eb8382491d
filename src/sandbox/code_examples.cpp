#include "sandbox/code_examples.hpp"

namespace coderun::sandbox {
namespace {

constexpr const char* kPythonExample = R"py(# Python example
print("Hello from the sandbox!")

# Basic operations
numbers = [1, 2, 3, 4, 5]
squared = [x**2 for x in numbers]
print(f"Numbers: {numbers}")
print(f"Squares: {squared}")

# A simple function
def fibonacci(n):
    if n <= 1:
        return n
    return fibonacci(n-1) + fibonacci(n-2)

print(f"Fibonacci of 8: {fibonacci(8)}")
)py";

constexpr const char* kJavascriptExample = R"js(// JavaScript example
console.log("Hello from the sandbox!");

// Basic operations
const numbers = [1, 2, 3, 4, 5];
const squared = numbers.map(x => x * x);
console.log("Numbers:", numbers);
console.log("Squares:", squared);

// A simple function
function fibonacci(n) {
    if (n <= 1) return n;
    return fibonacci(n - 1) + fibonacci(n - 2);
}

console.log(`Fibonacci of 8: ${fibonacci(8)}`);
)js";

constexpr const char* kBashExample = R"sh(#!/bin/bash
# Bash example
echo "Hello from the sandbox!"

# Variables
name="User"
echo "Welcome, $name"

# A simple loop
echo "Counting from 1 to 5:"
for i in {1..5}; do
    echo "Number: $i"
done

# Current date
echo "Current date: $(date)"
)sh";

}  // namespace

const std::map<std::string, std::string>& BuiltinExamples() {
    static const std::map<std::string, std::string> examples = {
        {"python", kPythonExample},
        {"javascript", kJavascriptExample},
        {"bash", kBashExample}
    };
    return examples;
}

}  // namespace coderun::sandbox
