#pragma once

// Lets a set of lambdas be passed to std::visit as one visitor
template <class... Ts>
struct Overload : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
Overload(Ts...) -> Overload<Ts...>;
