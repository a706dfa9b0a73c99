/* \file       settings.hh
 * @brief      Configuration of the lrudir library
 *
 * @section 1 Configuration file path
 * Settings will read the configuration file lrudir.json and
 * load all the necessary properties. The path of the lrudir.json
 * will be:
 *  -# Constructor path @see Settings::Settings(std::string)
 *  -# ~/.lrudir.json
 *  -# /etc/lrudir.json
 *  -# Hardcoded path, setted with LRUDIR_CONF_PATH
 *
 * When none of them exists the settings stay empty and every
 * getter with a default value returns that default.
 *
 * @section 2 Usage
 * @code
 * Settings setted = Settings().load();
 * string name = setted.get<string>("log.name", "lrudir");
 * @endcode
 *
 * @attention This class uses the P.I.M.P.L. (Pointer to implementation) idiom
 *            this reduces the complexity of the interface and compilation time.
 */
#ifndef __SETTINGS_HH_
#define __SETTINGS_HH_

#include <string>
#include <memory>

namespace lrudir {

class Settings
{
  private:
    class SettingsImpl;
    std::unique_ptr<SettingsImpl> impl;

  public:
    Settings();
    explicit Settings(std::string);

    Settings(const Settings&);
    Settings(Settings&&);          //! Move operators
    Settings& operator=(Settings&&);    //!

    ~Settings();

    Settings& load () &;
    Settings&& load () &&;

    bool is_loaded () const;
    std::string get_path () const;

    template <typename T> T get (std::string) const;
    template <typename T> T get (std::string, T) const;
};

template<> std::string Settings::get (std::string) const;
template<> std::string Settings::get (std::string, std::string) const;

} /* namespace lrudir */

#endif
