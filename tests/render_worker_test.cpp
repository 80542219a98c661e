#include "ui/render_worker.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace {
struct Presented {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Cairo::RefPtr<Cairo::ImageSurface>> images;

    ui::RenderWorker::Presenter presenter() {
        return [this](Cairo::RefPtr<Cairo::ImageSurface> image) {
            std::lock_guard<std::mutex> lock(mutex);
            images.push_back(image);
            cv.notify_all();
        };
    }

    bool wait_for(std::size_t count) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [this, count]() { return images.size() >= count; });
    }

    std::size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return images.size();
    }
};

core::ZoneLayout single_cell(double size) {
    core::ZoneLayout layout;
    layout.width = size;
    layout.height = size;
    layout.cols = 1;
    layout.rows = 1;
    layout.size = size;
    layout.gap = core::kCellGap;
    layout.total_leds = 1;
    return layout;
}
}  // namespace

int main() {
    {
        // Nothing is presented until both a layout and a frame are known.
        Presented presented;
        auto worker = std::make_unique<ui::RenderWorker>();
        assert(worker->running());

        worker->post(ui::RenderWorker::Init{Cairo::RefPtr<Cairo::ImageSurface>(), 2.0, presented.presenter()});
        worker->post(ui::RenderWorker::Layout{single_cell(10.0)});
        worker->post(ui::RenderWorker::Frame{std::vector<LedColor>{{0, 0, 255}}, false});

        assert(presented.wait_for(1));
        worker.reset();
        assert(presented.count() == 1);

        const auto& image = presented.images[0];
        assert(image->get_width() == 20);
        assert(image->get_height() == 20);
    }

    {
        // Frames without a layout are kept and drawn once the layout arrives.
        Presented presented;
        auto worker = std::make_unique<ui::RenderWorker>();
        worker->post(ui::RenderWorker::Init{Cairo::RefPtr<Cairo::ImageSurface>(), 1.0, presented.presenter()});
        worker->post(ui::RenderWorker::Frame{std::nullopt, true});
        worker->post(ui::RenderWorker::Frame{std::vector<LedColor>{{1, 2, 3}}, false});
        worker->post(ui::RenderWorker::Layout{single_cell(8.0)});

        assert(presented.wait_for(1));
        worker->post(ui::RenderWorker::Layout{single_cell(12.0)});
        assert(presented.wait_for(2));
        worker.reset();

        assert(presented.count() == 2);
        assert(presented.images[0]->get_width() == 8);
        assert(presented.images[1]->get_width() == 12);
    }

    {
        // An empty viewport never reaches the presenter.
        Presented presented;
        auto worker = std::make_unique<ui::RenderWorker>();
        worker->post(ui::RenderWorker::Init{Cairo::RefPtr<Cairo::ImageSurface>(), 1.0, presented.presenter()});
        worker->post(ui::RenderWorker::Layout{single_cell(0.0)});
        worker->post(ui::RenderWorker::Frame{std::nullopt, true});
        worker.reset();
        assert(presented.count() == 0);
    }

    return 0;
}
