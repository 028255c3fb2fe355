#pragma once

// Visitor built from lambdas, for std::visit over result variants.
template <class... Ts>
struct Overloaded : Ts...
{
	using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
