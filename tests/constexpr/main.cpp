// Every test in this directory is a static_assert; building the target is running it.
int main() {
    return 0;
}
