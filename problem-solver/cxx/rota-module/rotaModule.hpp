#pragma once

#include <sc-memory/sc_module.hpp>

class RotaModule : public ScModule
{
};
