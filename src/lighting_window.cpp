#include "lighting_window.hpp"

#include "core/logging.hpp"
#include "ui/led_visualizer.hpp"
#include "ui/scope_controls_panel.hpp"

#include <chrono>
#include <filesystem>
#include <gtkmm/settings.h>

namespace {
constexpr std::chrono::milliseconds kBrightnessInterval(50);
constexpr std::chrono::milliseconds kParamsInterval(50);

std::string resolve_socket_path(const AppSettings& settings) {
    return settings.socket_path.empty() ? lightdesk::default_socket_path() : settings.socket_path;
}
}  // namespace

LightingWindow::LightingWindow(const AppSettings& settings)
: m_MainVBox(Gtk::Orientation::VERTICAL),
  m_HBox(Gtk::Orientation::HORIZONTAL),
  m_ContentVBox(Gtk::Orientation::VERTICAL),
  m_Settings(settings),
  m_Backend(resolve_socket_path(settings)),
  m_DevicesController(m_Backend),
  m_Distributor(m_Backend),
  m_StreamBinding(m_Distributor, std::chrono::milliseconds(settings.stream_interval_ms),
                  [this](const std::vector<LedColor>& colors) { on_led_frame(colors); }),
  m_BrightnessInvoker(
      kBrightnessInterval,
      [this](const BrightnessRequest& request) { send_brightness(request); },
      [](const BrightnessRequest& lhs, const BrightnessRequest& rhs) {
          return lhs.scope == rhs.scope && lhs.value == rhs.value;
      }),
  m_ParamsInvoker(
      kParamsInterval,
      [this](const ParamsRequest& request) { send_params(request); },
      [](const ParamsRequest& lhs, const ParamsRequest& rhs) {
          return lhs.scope == rhs.scope && lhs.params == rhs.params;
      })
{
    // Force Adwaita theme to avoid system theme interference
    auto gtkSettings = Gtk::Settings::get_default();
    if (gtkSettings) {
        gtkSettings->property_gtk_theme_name().set_value("Adwaita");
    }

    set_title("LightDesk");
    set_default_size(1000, 650);

    set_titlebar(m_HeaderBar);
    m_HeaderBar.set_show_title_buttons(true);

    m_Button_Rescan.set_icon_name("view-refresh-symbolic");
    m_Button_Rescan.set_tooltip_text("Scan for Devices");
    m_Button_Rescan.signal_clicked().connect(sigc::mem_fun(*this, &LightingWindow::on_button_rescan));
    m_HeaderBar.pack_start(m_Button_Rescan);

    set_child(m_MainVBox);

    auto css_provider = Gtk::CssProvider::create();
    if (std::filesystem::exists("style.css")) {
        css_provider->load_from_path("style.css");
    } else if (std::filesystem::exists("src/style.css")) {
        css_provider->load_from_path("src/style.css");
    } else {
        logging::warn("ui.style_missing", {{"file", "style.css"}});
    }

    auto display = Gdk::Display::get_default();
    if (display) {
        Gtk::StyleContext::add_provider_for_display(display, css_provider, GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
    } else {
        logging::warn("ui.no_display");
    }

    m_HBox.set_expand(true);
    m_MainVBox.append(m_HBox);

    m_ScopeTreeStore = Gtk::TreeStore::create(m_ScopeColumns);
    m_TreeView.set_model(m_ScopeTreeStore);
    m_TreeView.append_column("Scope", m_ScopeColumns.m_col_name);
    m_TreeView.append_column("", m_ScopeColumns.m_col_state);
    m_TreeView.set_headers_visible(false);
    m_TreeView.get_selection()->signal_changed().connect(
        sigc::mem_fun(*this, &LightingWindow::on_scope_row_selected));
    m_TreeView.add_css_class("sidebar");

    auto sidebarScroll = Gtk::make_managed<Gtk::ScrolledWindow>();
    sidebarScroll->set_child(m_TreeView);
    sidebarScroll->set_policy(Gtk::PolicyType::NEVER, Gtk::PolicyType::AUTOMATIC);
    sidebarScroll->set_size_request(260, -1);
    sidebarScroll->add_css_class("sidebar-scroll");
    m_HBox.append(*sidebarScroll);

    m_ContentVBox.set_expand(true);
    m_ContentVBox.set_margin(20);
    m_ContentVBox.set_spacing(20);
    m_HBox.append(m_ContentVBox);

    m_ControlsPanel = std::make_unique<ui::ScopeControlsPanel>(
        [this](const std::optional<std::string>& effectId) { on_effect_chosen(effectId); },
        [this](int value) { on_brightness_changed(value); },
        [this](const std::string& key, const EffectParamValue& value) { on_param_changed(key, value); });
    m_ContentVBox.append(*m_ControlsPanel->widget());

    auto previewFrame = Gtk::make_managed<Gtk::Frame>("Preview");
    previewFrame->set_expand(true);
    m_Visualizer = Gtk::make_managed<ui::LedVisualizer>(m_Settings.render_worker);
    m_Visualizer->set_scope_activated_handler([this](const ScopeRef& scope) { on_scope_activated(scope); });
    previewFrame->set_child(*m_Visualizer);
    m_ContentVBox.append(*previewFrame);

    m_StatusLabel.set_halign(Gtk::Align::START);
    m_StatusLabel.set_margin_start(12);
    m_StatusLabel.set_margin_end(12);
    m_StatusLabel.set_margin_bottom(8);
    m_StatusLabel.set_text("Ready");
    m_MainVBox.append(m_StatusLabel);

    m_StreamBinding.set_listen_callback([this](bool listening) { on_stream_state(listening); });

    load_devices(false);
}

LightingWindow::~LightingWindow() {
    m_ViewsIdle.disconnect();
    cancel_pending_edits();
    m_StreamBinding.unbind();
}

void LightingWindow::on_button_rescan() {
    load_devices(true);
}

void LightingWindow::set_status_message(const std::string& text, bool is_error) {
    m_StatusLabel.set_text(text);
    if (is_error) {
        m_StatusLabel.remove_css_class("status-ok");
        m_StatusLabel.add_css_class("status-error");
    } else {
        m_StatusLabel.remove_css_class("status-error");
        m_StatusLabel.add_css_class("status-ok");
    }
}

void LightingWindow::show_controller_status() {
    set_status_message(m_DevicesController.status_message(), m_DevicesController.status_is_error());
}
