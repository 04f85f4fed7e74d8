#pragma once

#include "sy/types.hpp"

#include <args.hxx>

extern args::Group    global_group;
extern args::HelpFlag help;

void SetLogging(std::string const &name);
void ParseCommand(args::Subparser &parser);
void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname);

template <int N> struct SzReader
{
  void operator()(std::string const &name, std::string const &value, sy::Sz<N> &x);
};

template <int ND> using SzFlag = args::ValueFlag<sy::Sz<ND>, SzReader<ND>>;

template <typename T, int ND> struct ArrayReader
{
  void operator()(std::string const &name, std::string const &value, Eigen::Array<T, ND, 1> &x);
};

template <typename T, int ND> using ArrayFlag = args::ValueFlag<Eigen::Array<T, ND, 1>, ArrayReader<T, ND>>;
