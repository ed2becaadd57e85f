#pragma once

#include <utility>

#include "rule_engine.hpp"

namespace lifebound {

    // The grid being edited (setup phase) or run (running phase).
    // Pacing is up to the caller; see `end_frame`.
    class simulationT {
    public:
        enum phaseE { Setup, Running };

    private:
        const surfaceT m_surface;
        gridT m_grid;
        phaseE m_phase = Setup;
        int m_gen = 0;

        bool m_pause = false;
        int m_extra_step = 0; // Requested by `step` for the current frame.

    public:
        explicit simulationT(const surfaceT& surface) : m_surface{surface}, m_grid{create_empty(surface)} {}

        const surfaceT& surface() const { return m_surface; }
        const gridT& grid() const { return m_grid; }
        phaseE phase() const { return m_phase; }
        int gen() const { return m_gen; }

        // Setup phase only.
        void set_grid(gridT&& grid) {
            assert(m_phase == Setup && grid.surface() == m_surface);
            m_grid = std::move(grid);
        }
        [[nodiscard]] bool toggle(vecT cell) {
            assert(m_phase == Setup);
            return m_grid.toggle(cell);
        }

        void start() {
            assert(m_phase == Setup);
            m_phase = Running;
            m_gen = 0;
            m_pause = false;
            m_extra_step = 0;
        }

        // Back to the setup phase with an empty grid.
        void reset() {
            assert(m_phase == Running);
            m_phase = Setup;
            m_gen = 0;
            m_pause = false;
            m_extra_step = 0;
            m_grid = create_empty(m_surface);
        }

        bool& pause() { return m_pause; }
        bool pause() const { return m_pause; }

        void step() {
            assert(m_phase == Running && m_pause);
            ++m_extra_step;
        }

        // `tick` ~ a generation is due. Returns the number of generations advanced.
        int end_frame(bool tick) {
            int count = std::exchange(m_extra_step, 0);
            if (m_phase != Running) {
                return 0;
            }

            if (count == 0 && !m_pause && tick) {
                count = 1;
            }
            if (count != 0) {
                m_grid = advance(m_grid, count);
                m_gen += count;
            }
            return count;
        }
    };

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_simulation_phases = [] {
            const surfaceT surface{{.x = 10, .y = 10}};
            simulationT sim(surface);
            assert(sim.phase() == simulationT::Setup && sim.grid().population() == 0);

            // Blinker.
            for (const vecT cell : {vecT{4, 5}, vecT{5, 5}, vecT{6, 5}}) {
                assert(sim.toggle(cell));
            }
            assert(!sim.toggle({10, 5}));
            assert(sim.end_frame(true) == 0 && sim.gen() == 0);

            sim.start();
            assert(sim.end_frame(false) == 0);
            assert(sim.end_frame(true) == 1 && sim.gen() == 1);
            assert(sim.grid().alive({5, 4}) && sim.grid().alive({5, 6}) && !sim.grid().alive({4, 5}));

            sim.reset();
            assert(sim.phase() == simulationT::Setup && sim.gen() == 0);
            assert(sim.grid() == create_empty(surface));
        };

        inline const testT test_simulation_step = [] {
            const surfaceT surface{{.x = 10, .y = 10}};
            simulationT sim(surface);
            assert(sim.toggle({4, 5}) && sim.toggle({5, 5}) && sim.toggle({6, 5}));
            sim.start();

            sim.pause() = true;
            assert(sim.end_frame(true) == 0 && sim.gen() == 0);
            sim.step();
            sim.step();
            assert(sim.end_frame(false) == 2 && sim.gen() == 2);
            assert(sim.end_frame(false) == 0);

            // Steps requested in the frame that goes back to setup are dropped.
            sim.step();
            sim.reset();
            assert(sim.end_frame(true) == 0);
            assert(sim.toggle({1, 1}));
            sim.start();
            assert(sim.end_frame(false) == 0 && sim.gen() == 0);
            assert(sim.grid().population() == 1);
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

} // namespace lifebound
