/***
 * Name: pyrite::parse precedence levels
 * Purpose: Binding strength of expression operators, loosest first.
 */
#pragma once

namespace pyrite::parse {

constexpr int kPrecOr = 1;
constexpr int kPrecAnd = 2;
constexpr int kPrecNot = 3; // prefix 'not'
constexpr int kPrecCompare = 4; // N-ary chain: < > == >= <= != in, not in, is, is not
constexpr int kPrecBitOr = 5;
constexpr int kPrecBitXor = 6;
constexpr int kPrecBitAnd = 7;
constexpr int kPrecShift = 8;
constexpr int kPrecArith = 9; // + -
constexpr int kPrecTerm = 10; // * / // % @
constexpr int kPrecUnary = 11; // prefix - + ~
constexpr int kPrecPower = 12; // ** (right associative)

} // namespace pyrite::parse
