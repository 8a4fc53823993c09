#pragma once

namespace prism::mesh {

    // Scheduler hook called at every checkpoint of a mesh build. Returning false
    // abandons the build; the partial mesh is discarded.
    class IAwaitCaller {
    public:
        virtual ~IAwaitCaller() = default;
        virtual bool nextFrame() = 0;
    };

    // Runs the whole build without giving control away.
    class ImmediateAwaitCaller final : public IAwaitCaller {
    public:
        bool nextFrame() override { return true; }
    };

}
