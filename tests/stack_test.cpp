#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "stack.hpp"

TEST(StackTest, LastInFirstOut) {
    intcalc::Stack<int> stack;
    EXPECT_TRUE(stack.isEmpty());
    stack.push(1);
    stack.push(2);
    stack.push(3);
    EXPECT_EQ(stack.size(), 3u);
    EXPECT_EQ(stack.peek(), 3);
    EXPECT_EQ(stack.pop(), 3);
    EXPECT_EQ(stack.pop(), 2);
    EXPECT_EQ(stack.pop(), 1);
    EXPECT_TRUE(stack.isEmpty());
}

TEST(StackTest, PeekDoesNotRemove) {
    intcalc::Stack<std::string> stack;
    stack.push("x");
    EXPECT_EQ(stack.peek(), "x");
    EXPECT_EQ(stack.size(), 1u);
}

TEST(StackTest, EmptyStackThrows) {
    intcalc::Stack<int> stack;
    EXPECT_THROW(stack.pop(), std::logic_error);
    EXPECT_THROW(stack.peek(), std::logic_error);
}
