#pragma once

template <typename T>
struct MatrixTraits;

template <>
struct MatrixTraits<double> {
    static constexpr const char* name = "float64";
};

template <>
struct MatrixTraits<float> {
    static constexpr const char* name = "float32";
};
