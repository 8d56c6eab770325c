#pragma once

#include <binread/array.hpp>
#include <binread/named_args.hpp>
#include <binread/primitives.hpp>
#include <binread/read.hpp>
#include <binread/tuple.hpp>
#include <binread/vector.hpp>
#include <binread/wrappers.hpp>
