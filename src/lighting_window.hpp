#ifndef LIGHTING_WINDOW_HPP
#define LIGHTING_WINDOW_HPP

#include "config_io.hpp"
#include "core/color_stream.hpp"
#include "core/scope_tree.hpp"
#include "features/devices_controller.hpp"
#include "features/led_stream_binding.hpp"
#include "features/throttled_invoker.hpp"
#include "platform/lightdesk_backend.hpp"

#include <gtkmm.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ui {
class LedVisualizer;
class ScopeControlsPanel;
}

class LightingWindow : public Gtk::Window
{
public:
    class ScopeColumns : public Gtk::TreeModel::ColumnRecord {
    public:
        ScopeColumns() { add(m_col_name); add(m_col_state); add(m_col_node_id); }
        Gtk::TreeModelColumn<Glib::ustring> m_col_name;
        Gtk::TreeModelColumn<Glib::ustring> m_col_state;
        Gtk::TreeModelColumn<Glib::ustring> m_col_node_id;
    };

    struct BrightnessRequest {
        ScopeRef scope;
        int value = 0;
    };

    // Parameter edits since the last send, merged per key.
    struct ParamsRequest {
        ScopeRef scope;
        EffectParams params;
    };

    explicit LightingWindow(const AppSettings& settings);
    virtual ~LightingWindow();

protected:
    void on_button_rescan();
    void on_scope_row_selected();
    void on_effect_chosen(const std::optional<std::string>& effect_id);
    void on_brightness_changed(int value);
    void on_param_changed(const std::string& key, const EffectParamValue& value);
    void on_scope_activated(const ScopeRef& scope);
    void on_led_frame(const std::vector<LedColor>& colors);
    void on_stream_state(bool listening);

    Gtk::HeaderBar m_HeaderBar;
    Gtk::Box m_MainVBox;
    Gtk::Box m_HBox;
    Gtk::TreeView m_TreeView;
    Gtk::Box m_ContentVBox;
    Gtk::Label m_StatusLabel;
    Gtk::Button m_Button_Rescan;

    ScopeColumns m_ScopeColumns;
    Glib::RefPtr<Gtk::TreeStore> m_ScopeTreeStore;
    std::map<std::string, Gtk::TreeModel::iterator> m_NodeIters;
    core::ScopeTree m_ScopeTree;

    std::unique_ptr<ui::ScopeControlsPanel> m_ControlsPanel;
    ui::LedVisualizer* m_Visualizer = nullptr;

    AppSettings m_Settings;
    LightdeskBackend m_Backend;
    DevicesController m_DevicesController;
    core::ColorStreamDistributor m_Distributor;
    features::LedStreamBinding m_StreamBinding;
    features::LatestThrottledInvoker<BrightnessRequest> m_BrightnessInvoker;
    features::LatestThrottledInvoker<ParamsRequest> m_ParamsInvoker;
    std::optional<ParamsRequest> m_PendingParams;
    sigc::connection m_ViewsIdle;
    bool m_selecting_programmatically = false;

    void load_devices(bool rescan);
    void rebuild_scope_tree();
    void append_scope_node(std::size_t index, const Gtk::TreeModel::iterator* parent);
    void refresh_scope_states();
    void update_scope_views();
    void schedule_views_update();
    void send_brightness(const BrightnessRequest& request);
    void send_params(const ParamsRequest& request);
    void cancel_pending_edits();
    void set_status_message(const std::string& text, bool is_error);
    void show_controller_status();
};

#endif
