#include "completion.hpp"

namespace stashy::cli {

namespace {

const char* const kBashScript = R"SH(# bash completion for stashy
_stashy() {
    local cur prev cmd
    cur="${COMP_WORDS[COMP_CWORD]}"
    prev="${COMP_WORDS[COMP_CWORD-1]}"
    cmd="${COMP_WORDS[1]}"

    if [[ ${COMP_CWORD} -eq 1 ]]; then
        COMPREPLY=( $(compgen -W "login logout create list get update delete search config --verbose --version --completions --help" -- "${cur}") )
        return 0
    fi

    case "${prev}" in
        -s|--sort)
            COMPREPLY=( $(compgen -W "newest oldest alpha-asc alpha-desc" -- "${cur}") )
            return 0 ;;
        -o|--output-dir)
            COMPREPLY=( $(compgen -d -- "${cur}") )
            return 0 ;;
        --completions)
            COMPREPLY=( $(compgen -W "bash zsh fish" -- "${cur}") )
            return 0 ;;
    esac

    case "${cmd}" in
        login)  COMPREPLY=( $(compgen -W "--key --key-name" -- "${cur}") ) ;;
        create) COMPREPLY=( $(compgen -f -W "--title --desc --categories --public --yes" -- "${cur}") ) ;;
        update) COMPREPLY=( $(compgen -f -W "--yes" -- "${cur}") ) ;;
        list)   COMPREPLY=( $(compgen -W "--all --number --page" -- "${cur}") ) ;;
        get)    COMPREPLY=( $(compgen -W "--raw --output-dir" -- "${cur}") ) ;;
        delete) COMPREPLY=( $(compgen -W "--force" -- "${cur}") ) ;;
        search) COMPREPLY=( $(compgen -W "--sort --search-code" -- "${cur}") ) ;;
        config) COMPREPLY=( $(compgen -W "--page-size --timeout" -- "${cur}") ) ;;
    esac
    return 0
}
complete -o filenames -F _stashy stashy
)SH";

const char* const kZshScript = R"SH(#compdef stashy

_stashy() {
    local -a commands sorts
    commands=(
        'login:Authenticate with your snippet server'
        'logout:Forget the stored API key'
        'create:Create a new snippet'
        'list:List your snippets'
        'get:Show a snippet and its files'
        'update:Update an existing snippet'
        'delete:Delete a snippet'
        'search:Search snippets'
        'config:Show or change client settings'
    )
    sorts=(newest oldest alpha-asc alpha-desc)

    if (( CURRENT == 2 )); then
        _describe 'command' commands
        return
    fi

    case "${words[2]}" in
        login)  _arguments '2:server url:' '(-k --key)'{-k,--key}'[API key]:key:' '--key-name[Name for a new key]:name:' ;;
        create) _arguments '*:file:_files' '(-t --title)'{-t,--title}'[Title]:title:' \
                    '(-d --desc)'{-d,--desc}'[Description]:text:' \
                    '(-c --categories)'{-c,--categories}'[Categories]:list:' \
                    '--public[Make public]' '(-y --yes)'{-y,--yes}'[Do not prompt]' ;;
        update) _arguments '2:id:' '*:file:_files' '(-y --yes)'{-y,--yes}'[Do not prompt]' ;;
        list)   _arguments '(-a --all)'{-a,--all}'[Fetch every page]' \
                    '(-n --number)'{-n,--number}'[Page size]:num:' '(-p --page)'{-p,--page}'[Page]:page:' ;;
        get)    _arguments '2:id:' '--raw[Contents only]' '(-o --output-dir)'{-o,--output-dir}'[Directory]:dir:_files -/' ;;
        delete) _arguments '2:id:' '(-f --force)'{-f,--force}'[Skip confirmation]' ;;
        search) _arguments '2:query:' "(-s --sort)"{-s,--sort}"[Order]:order:(${sorts})" '--search-code[Search contents]' ;;
        config) _arguments '--page-size[Page size]:num:' '--timeout[Seconds]:seconds:' ;;
    esac
}

_stashy "$@"
)SH";

const char* const kFishScript = R"SH(# fish completion for stashy
set -l cmds login logout create list get update delete search config

complete -c stashy -f
complete -c stashy -n "not __fish_seen_subcommand_from $cmds" -a login -d 'Authenticate with your snippet server'
complete -c stashy -n "not __fish_seen_subcommand_from $cmds" -a logout -d 'Forget the stored API key'
complete -c stashy -n "not __fish_seen_subcommand_from $cmds" -a create -d 'Create a new snippet'
complete -c stashy -n "not __fish_seen_subcommand_from $cmds" -a list -d 'List your snippets'
complete -c stashy -n "not __fish_seen_subcommand_from $cmds" -a get -d 'Show a snippet and its files'
complete -c stashy -n "not __fish_seen_subcommand_from $cmds" -a update -d 'Update an existing snippet'
complete -c stashy -n "not __fish_seen_subcommand_from $cmds" -a delete -d 'Delete a snippet'
complete -c stashy -n "not __fish_seen_subcommand_from $cmds" -a search -d 'Search snippets'
complete -c stashy -n "not __fish_seen_subcommand_from $cmds" -a config -d 'Show or change client settings'
complete -c stashy -l verbose -d 'Print debug output'
complete -c stashy -l completions -x -a 'bash zsh fish' -d 'Print a completion script'

complete -c stashy -n '__fish_seen_subcommand_from login' -s k -l key -x -d 'API key'
complete -c stashy -n '__fish_seen_subcommand_from login' -l key-name -x -d 'Name for a new key'
complete -c stashy -n '__fish_seen_subcommand_from create update' -F
complete -c stashy -n '__fish_seen_subcommand_from create' -s t -l title -x -d 'Title'
complete -c stashy -n '__fish_seen_subcommand_from create' -s d -l desc -x -d 'Description'
complete -c stashy -n '__fish_seen_subcommand_from create' -s c -l categories -x -d 'Categories'
complete -c stashy -n '__fish_seen_subcommand_from create' -l public -d 'Make public'
complete -c stashy -n '__fish_seen_subcommand_from create update' -s y -l yes -d 'Do not prompt'
complete -c stashy -n '__fish_seen_subcommand_from list' -s a -l all -d 'Fetch every page'
complete -c stashy -n '__fish_seen_subcommand_from list' -s n -l number -x -d 'Page size'
complete -c stashy -n '__fish_seen_subcommand_from list' -s p -l page -x -d 'Page'
complete -c stashy -n '__fish_seen_subcommand_from get' -l raw -d 'Contents only'
complete -c stashy -n '__fish_seen_subcommand_from get' -s o -l output-dir -r -a '(__fish_complete_directories)' -d 'Directory'
complete -c stashy -n '__fish_seen_subcommand_from delete' -s f -l force -d 'Skip confirmation'
complete -c stashy -n '__fish_seen_subcommand_from search' -s s -l sort -x -a 'newest oldest alpha-asc alpha-desc' -d 'Order'
complete -c stashy -n '__fish_seen_subcommand_from search' -l search-code -d 'Search contents'
complete -c stashy -n '__fish_seen_subcommand_from config' -l page-size -x -d 'Page size'
complete -c stashy -n '__fish_seen_subcommand_from config' -l timeout -x -d 'Seconds'
)SH";

}  // namespace

std::optional<std::string> completion_script(const std::string& shell) {
    if (shell == "bash") return std::string(kBashScript);
    if (shell == "zsh") return std::string(kZshScript);
    if (shell == "fish") return std::string(kFishScript);
    return std::nullopt;
}

}  // namespace stashy::cli
