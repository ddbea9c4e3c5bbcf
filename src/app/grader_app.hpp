#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace hdlgrader {

/// Grades every submission of the configured assignments and posts the results to the grade ledger
class GraderApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace hdlgrader
